// ============= tools/index_benchmark.cpp =============
/*
 * Exact scan vs HNSW on synthetic embeddings
 *
 * ./build/bin/index_benchmark --n 5000 --dim 512 --queries 500
 * ./index_benchmark --n 200 --metric l2 --noise 0.3
 * ./index_benchmark --config configs/facewatch.toml
 *
 * --config takes metric, HNSW parameters and logging from the file;
 * --metric still overrides the metric.
 *
 * Reports build time, query latency and top-1 agreement of the
 * approximate backend with the exact one.
 */

#include "facewatch/core/logging.hpp"
#include "facewatch/core/pipeline_config.hpp"
#include "facewatch/core/vector_math.hpp"
#include "facewatch/database/similarity_index.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace facewatch;

struct BenchmarkResult {
    double build_ms = 0;
    double avg_ms = 0;
    double min_ms = 0;
    double max_ms = 0;
    double qps = 0;
    std::vector<std::string> top1;
};

BenchmarkResult benchmark_index(SimilarityIndex& index,
                                const std::vector<IndexEntry>& entries,
                                const std::vector<EmbeddingVector>& queries,
                                int warmup = 10)
{
    BenchmarkResult r;

    auto start = std::chrono::high_resolution_clock::now();
    index.build_index(entries);
    auto end = std::chrono::high_resolution_clock::now();
    r.build_ms = std::chrono::duration<double, std::milli>(end - start).count();

    for (int i = 0; i < warmup && i < static_cast<int>(queries.size()); i++) {
        index.query(queries[i], 1);
    }

    std::vector<double> times;
    times.reserve(queries.size());
    for (const auto& q : queries) {
        auto t0 = std::chrono::high_resolution_clock::now();
        auto hits = index.query(q, 1);
        auto t1 = std::chrono::high_resolution_clock::now();

        times.push_back(std::chrono::duration<double, std::milli>(t1 - t0).count());
        r.top1.push_back(hits.empty() ? "" : hits.front().name);
    }

    double sum = 0;
    for (double t : times) sum += t;
    r.avg_ms = times.empty() ? 0 : sum / times.size();
    r.min_ms = times.empty() ? 0 : *std::min_element(times.begin(), times.end());
    r.max_ms = times.empty() ? 0 : *std::max_element(times.begin(), times.end());
    r.qps = r.avg_ms > 0 ? 1000.0 / r.avg_ms : 0;
    return r;
}

void print_result(const std::string& name, const BenchmarkResult& r, size_t memory) {
    spdlog::info("{}:", name);
    spdlog::info("  Build:   {:.2f} ms", r.build_ms);
    spdlog::info("  Query:   {:.4f} ms avg (min {:.4f}, max {:.4f})", r.avg_ms, r.min_ms, r.max_ms);
    spdlog::info("  QPS:     {:.0f}", r.qps);
    spdlog::info("  Memory:  {:.2f} MB", memory / 1024.0 / 1024.0);
}

int main(int argc, char* argv[]) {
    init_logging("info");

    int n = 2000;
    int dim = 512;
    int num_queries = 200;
    float noise = 0.2f;
    std::string metric_name;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--n" && i + 1 < argc) n = std::stoi(argv[++i]);
        else if (arg == "--dim" && i + 1 < argc) dim = std::stoi(argv[++i]);
        else if (arg == "--queries" && i + 1 < argc) num_queries = std::stoi(argv[++i]);
        else if (arg == "--noise" && i + 1 < argc) noise = std::stof(argv[++i]);
        else if (arg == "--metric" && i + 1 < argc) metric_name = argv[++i];
        else if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else {
            spdlog::error("Usage: {} [--n N] [--dim D] [--queries Q] [--noise S] [--metric ip|l2] "
                          "[--config file.toml]", argv[0]);
            return 1;
        }
    }

    try {
        PipelineConfig config;
        if (!config_path.empty()) {
            config = load_pipeline_config(config_path);
            init_logging(config);
        }
        Metric metric = metric_name.empty() ? config.index.metric : metric_from_string(metric_name);

        spdlog::info("========================================");
        spdlog::info("  INDEX BENCHMARK");
        spdlog::info("========================================");
        spdlog::info("Identities: {}  Dim: {}  Queries: {}  Noise: {}  Metric: {}",
                     n, dim, num_queries, noise, to_string(metric));

        std::mt19937 gen(1234);
        std::normal_distribution<float> gauss(0.0f, 1.0f);

        std::vector<IndexEntry> entries;
        entries.reserve(n);
        for (int i = 0; i < n; i++) {
            EmbeddingVector v(dim);
            for (auto& x : v) x = gauss(gen);
            entries.push_back({"person_" + std::to_string(i), normalize(v)});
        }

        std::uniform_int_distribution<int> pick(0, n - 1);
        std::vector<EmbeddingVector> queries;
        queries.reserve(num_queries);
        for (int i = 0; i < num_queries; i++) {
            EmbeddingVector q = entries[pick(gen)].vector;
            for (auto& x : q) x += gauss(gen) * noise / std::sqrt(static_cast<float>(dim));
            queries.push_back(normalize(q));
        }

        SimilarityIndex::Config exact_cfg = config.index;
        exact_cfg.metric = metric;
        exact_cfg.approximate_threshold = static_cast<size_t>(n) + 1;
        SimilarityIndex exact(exact_cfg);

        SimilarityIndex::Config approx_cfg = config.index;
        approx_cfg.metric = metric;
        approx_cfg.approximate_threshold = 1;
        SimilarityIndex approx(approx_cfg);

        BenchmarkResult exact_r = benchmark_index(exact, entries, queries);
        BenchmarkResult approx_r = benchmark_index(approx, entries, queries);

        int agree = 0;
        for (size_t i = 0; i < queries.size(); i++) {
            if (exact_r.top1[i] == approx_r.top1[i]) agree++;
        }

        print_result("Exact scan", exact_r, exact.memory_usage());
        print_result("HNSW", approx_r, approx.memory_usage());

        spdlog::info("========================================");
        spdlog::info("Speedup:          {:.2f}x", approx_r.avg_ms > 0 ? exact_r.avg_ms / approx_r.avg_ms : 0.0);
        spdlog::info("Top-1 agreement:  {}/{} ({:.1f}%)", agree, queries.size(),
                     queries.empty() ? 0.0 : 100.0 * agree / queries.size());

    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
