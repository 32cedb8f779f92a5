#include "facewatch/core/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace facewatch {

void init_logging(const std::string& level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!file.empty()) {
        std::filesystem::path p(file);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, 5 * 1024 * 1024, 3));
    }

    auto logger = std::make_shared<spdlog::logger>("facewatch", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace facewatch
