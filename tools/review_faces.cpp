// ============= tools/review_faces.cpp =============
/*
 * Review tool for the unknown-face queue
 *
 * EXAMPLES:
 *
 * ./build/bin/review_faces data/facewatch.db --stats
 * ./review_faces data/facewatch.db --pending 20
 * ./review_faces data/facewatch.db --similar k3j9x0a1b2c4 0.75
 * ./review_faces data/facewatch.db --enroll k3j9x0a1b2c4 "Jane Doe"
 * ./review_faces data/facewatch.db --export-image k3j9x0a1b2c4 face.jpg
 * ./review_faces data/facewatch.db --config configs/facewatch.toml --identities
 * ./review_faces --config configs/facewatch.toml --pending 20
 *
 * Without a database argument the path comes from [database] path.
 * --config also applies the [logging] section.
 */

#include "facewatch/core/errors.hpp"
#include "facewatch/core/logging.hpp"
#include "facewatch/core/pipeline_config.hpp"
#include "facewatch/database/similarity_index.hpp"
#include "facewatch/database/sqlite_face_store.hpp"
#include "facewatch/recognition/identity_catalog.hpp"
#include "facewatch/review/unknown_review_queue.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace facewatch;

namespace {

std::string format_time(int64_t ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void print_detection_header() {
    std::cout << std::left
              << std::setw(14) << "ID"
              << std::setw(21) << "TIMESTAMP"
              << std::setw(8) << "TRACK"
              << std::setw(8) << "CONF"
              << std::setw(12) << "STATE"
              << std::setw(6) << "NEAR"
              << "IDENTITY\n";
    std::cout << std::string(80, '-') << "\n";
}

void print_detection_row(const Detection& d) {
    std::string who = d.is_matched() ? d.matched_identity : d.enrolled_as;
    std::cout << std::left
              << std::setw(14) << d.id
              << std::setw(21) << format_time(d.timestamp)
              << std::setw(8) << d.tracking_key
              << std::setw(8) << std::fixed << std::setprecision(3) << d.confidence
              << std::setw(12) << to_string(d.review_state)
              << std::setw(6) << (d.near_match ? "yes" : "")
              << who << "\n";
}

} // namespace

class ReviewTool {
public:
    ReviewTool(const std::string& db_path, const PipelineConfig& config)
        : store(db_path),
          index(config.index),
          catalog(store, index),
          queue(store, catalog, config.review)
    {
        catalog.reload();
    }

    void show_statistics() {
        StoreStats s = store.stats();

        std::cout << "\n=== STATISTICS ===\n";
        std::cout << "Database:          " << store.path() << "\n";
        std::cout << "Identities:        " << s.identities << "\n";
        std::cout << "Detections:        " << s.detections << "\n";
        std::cout << "  matched:         " << s.matched_detections << "\n";
        std::cout << "  pending review:  " << s.pending_review << "\n";
        std::cout << "Images:            " << s.images << "\n";
        std::cout << "Index backend:     " << to_string(index.backend())
                  << " (" << to_string(index.metric()) << ")\n";
    }

    void show_pending(int limit) {
        auto pending = queue.pending(limit);
        std::cout << "\n=== PENDING REVIEW (" << pending.size() << ") ===\n";
        print_detection_header();
        for (const auto& d : pending) {
            print_detection_row(d);
        }
    }

    void show_all(int limit) {
        auto detections = store.list_detections(limit, false);
        std::cout << "\n=== DETECTION LOG (" << detections.size() << ") ===\n";
        print_detection_header();
        for (const auto& d : detections) {
            print_detection_row(d);
        }
    }

    bool show(const std::string& id) {
        Detection d;
        if (!queue.get(id, d)) {
            std::cerr << "Detection not found: " << id << "\n";
            return false;
        }

        std::cout << "\n=== DETECTION " << d.id << " ===\n";
        std::cout << "Timestamp:    " << format_time(d.timestamp) << "\n";
        std::cout << "Camera:       " << d.camera_id << "\n";
        std::cout << "Track:        " << d.tracking_key << "\n";
        std::cout << "Confidence:   " << std::fixed << std::setprecision(3) << d.confidence << "\n";
        std::cout << "State:        " << to_string(d.review_state) << "\n";
        std::cout << "Queue entry:  " << (d.review_flag ? "yes" : "no") << "\n";
        std::cout << "Near match:   " << (d.near_match ? "yes" : "no") << "\n";
        if (d.is_matched()) std::cout << "Identity:     " << d.matched_identity << "\n";
        if (!d.enrolled_as.empty()) std::cout << "Enrolled as:  " << d.enrolled_as << "\n";
        std::cout << "Image:        " << (d.image_id.empty() ? "-" : d.image_id) << "\n";
        std::cout << "Embedding:    " << d.embedding.size() << "D\n";
        return true;
    }

    bool dismiss(const std::string& id) {
        if (!queue.dismiss(id)) {
            std::cerr << "Cannot dismiss " << id << " (not found or already reviewed)\n";
            return false;
        }
        std::cout << "✓ Dismissed " << id << "\n";
        return true;
    }

    bool enroll(const std::string& id, const std::string& name) {
        try {
            if (!queue.enroll(id, name)) {
                std::cerr << "Cannot enroll " << id << " (not found or already reviewed)\n";
                return false;
            }
        } catch (const NameConflict& e) {
            std::cerr << "Name already enrolled: " << e.name << "\n";
            return false;
        }
        std::cout << "✓ Enrolled " << id << " as " << name << "\n";
        return true;
    }

    bool remove_detection(const std::string& id) {
        if (!queue.delete_detection(id)) {
            std::cerr << "Detection not found: " << id << "\n";
            return false;
        }
        std::cout << "✓ Deleted " << id << "\n";
        return true;
    }

    void similar(const std::string& id, float threshold, int limit) {
        auto results = queue.find_similar(id, threshold, limit);
        std::cout << "\n=== SIMILAR TO " << id << " (>= " << threshold << ") ===\n";
        std::cout << std::left << std::setw(14) << "ID" << std::setw(10) << "SIM"
                  << "TIMESTAMP\n";
        std::cout << std::string(50, '-') << "\n";
        for (const auto& r : results) {
            std::cout << std::left << std::setw(14) << r.detection.id
                      << std::setw(10) << std::fixed << std::setprecision(3) << r.similarity
                      << format_time(r.detection.timestamp) << "\n";
        }
        if (results.empty()) {
            std::cout << "(none)\n";
        }
    }

    void identities() {
        auto list = catalog.list();
        std::cout << "\n=== IDENTITIES (" << list.size() << ") ===\n";
        std::cout << std::left << std::setw(24) << "NAME" << std::setw(21) << "ENROLLED"
                  << std::setw(21) << "UPDATED" << "MATCHES\n";
        std::cout << std::string(80, '-') << "\n";
        for (const auto& identity : list) {
            std::cout << std::left << std::setw(24) << identity.name
                      << std::setw(21) << format_time(identity.enrolled_at)
                      << std::setw(21) << format_time(identity.updated_at)
                      << identity.recognition_count << "\n";
        }
    }

    bool remove_identity(const std::string& name) {
        if (!catalog.remove(name)) {
            std::cerr << "Identity not found: " << name << "\n";
            return false;
        }
        std::cout << "✓ Removed identity " << name << "\n";
        return true;
    }

    bool export_image(const std::string& id, const std::string& file) {
        Detection d;
        if (!queue.get(id, d) || d.image_id.empty()) {
            std::cerr << "No image for detection " << id << "\n";
            return false;
        }
        ImageBytes bytes = store.fetch_image(d.image_id);
        if (bytes.empty()) {
            std::cerr << "Image " << d.image_id << " is missing\n";
            return false;
        }

        std::ofstream out(file, std::ios::binary);
        if (!out) {
            std::cerr << "Cannot write " << file << "\n";
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        std::cout << "✓ Image written to " << file << " (" << bytes.size() << " bytes)\n";
        return true;
    }

private:
    SqliteFaceStore store;
    SimilarityIndex index;
    IdentityCatalog catalog;
    UnknownReviewQueue queue;
};

void print_usage(const char* prog) {
    std::cout << "USAGE: " << prog << " [database.db] [--config file.toml] <command>\n\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  --stats                       Store statistics\n";
    std::cout << "  --pending [N]                 Unreviewed queue entries (default 50)\n";
    std::cout << "  --all [N]                     Detection log, any state\n";
    std::cout << "  --show ID                     One detection\n";
    std::cout << "  --dismiss ID                  Mark as dismissed\n";
    std::cout << "  --enroll ID NAME              Enroll as a new identity\n";
    std::cout << "  --delete ID                   Delete detection and image\n";
    std::cout << "  --similar ID [THRESHOLD]      Queue entries of the same person\n";
    std::cout << "  --export-image ID FILE        Write the face crop to FILE\n";
    std::cout << "  --identities                  Enrolled identities\n";
    std::cout << "  --remove-identity NAME        Remove an identity\n";
    std::cout << "  --show-config                 Effective configuration\n";
    std::cout << "\nEXAMPLE:\n";
    std::cout << "  " << prog << " data/facewatch.db --pending 20\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    init_logging("warn");

    try {
        int i = 1;
        std::string db_path;
        if (std::string(argv[i]).rfind("--", 0) != 0) {
            db_path = argv[i++];
        }

        PipelineConfig config;
        if (i + 1 < argc && std::string(argv[i]) == "--config") {
            config = load_pipeline_config(argv[i + 1]);
            init_logging(config);
            i += 2;
        }
        if (db_path.empty()) {
            db_path = config.db_path;
        }
        if (i >= argc) {
            print_usage(argv[0]);
            return 1;
        }

        std::string cmd = argv[i];
        auto has = [&](int n) { return i + n < argc; };

        if (cmd == "--show-config") {
            spdlog::set_level(std::min(spdlog::get_level(), spdlog::level::info));
            print_pipeline_config(config);
            return 0;
        }

        ReviewTool tool(db_path, config);

        if (cmd == "--stats") {
            tool.show_statistics();
        }
        else if (cmd == "--pending") {
            tool.show_pending(has(1) ? std::stoi(argv[i + 1]) : 50);
        }
        else if (cmd == "--all") {
            tool.show_all(has(1) ? std::stoi(argv[i + 1]) : 50);
        }
        else if (cmd == "--show" && has(1)) {
            return tool.show(argv[i + 1]) ? 0 : 1;
        }
        else if (cmd == "--dismiss" && has(1)) {
            return tool.dismiss(argv[i + 1]) ? 0 : 1;
        }
        else if (cmd == "--enroll" && has(2)) {
            return tool.enroll(argv[i + 1], argv[i + 2]) ? 0 : 1;
        }
        else if (cmd == "--delete" && has(1)) {
            return tool.remove_detection(argv[i + 1]) ? 0 : 1;
        }
        else if (cmd == "--similar" && has(1)) {
            float threshold = has(2) ? std::stof(argv[i + 2]) : config.review.similar_threshold;
            tool.similar(argv[i + 1], threshold, config.review.similar_limit);
        }
        else if (cmd == "--export-image" && has(2)) {
            return tool.export_image(argv[i + 1], argv[i + 2]) ? 0 : 1;
        }
        else if (cmd == "--identities") {
            tool.identities();
        }
        else if (cmd == "--remove-identity" && has(1)) {
            return tool.remove_identity(argv[i + 1]) ? 0 : 1;
        }
        else {
            print_usage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
