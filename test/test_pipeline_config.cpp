#include "facewatch/core/pipeline_config.hpp"
#include "facewatch/core/logging.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace facewatch;

TEST(TomlConfig, ParsesSectionsCommentsAndQuotes) {
    TomlConfig toml;
    toml.load_string(R"(
        # top comment
        [database]
        path = "data/a#b.db"   # trailing comment
        writer_threads = 4

        [adaptive]
        enabled = false
        alpha = 0.25
    )");

    EXPECT_EQ(toml.get("database.path"), "data/a#b.db");
    EXPECT_EQ(toml.get_int("database.writer_threads"), 4);
    EXPECT_FALSE(toml.get_bool("adaptive.enabled", true));
    EXPECT_FLOAT_EQ(toml.get_float("adaptive.alpha"), 0.25f);
    EXPECT_FALSE(toml.has("adaptive.missing"));
    EXPECT_EQ(toml.get_int("adaptive.missing", 9), 9);
}

TEST(TomlConfig, BadNumbersFallBackToDefault) {
    TomlConfig toml;
    toml.load_string("[a]\nn = twelve\nf = x\nb = maybe\n");
    EXPECT_EQ(toml.get_int("a.n", 12), 12);
    EXPECT_FLOAT_EQ(toml.get_float("a.f", 0.5f), 0.5f);
    EXPECT_TRUE(toml.get_bool("a.b", true));
}

TEST(PipelineConfig, DefaultsWhenEmpty) {
    TomlConfig toml;
    PipelineConfig config = pipeline_config_from_toml(toml);

    EXPECT_FLOAT_EQ(config.matcher.match_threshold, 0.40f);
    EXPECT_NEAR(config.matcher.auto_review_threshold, 0.30f, 1e-6);
    EXPECT_FLOAT_EQ(config.matcher.unknown_min_confidence, 0.25f);
    EXPECT_EQ(config.index.approximate_threshold, 50u);
    EXPECT_EQ(config.index.metric, Metric::InnerProduct);
    EXPECT_EQ(config.index.hnsw.M, 16);
    EXPECT_EQ(config.index.hnsw.ef_construction, 200);
    EXPECT_EQ(config.aggregator.window, 3u);
    EXPECT_EQ(config.aggregator.max_idle_cycles, 30u);
    EXPECT_FLOAT_EQ(config.adaptive.alpha, 0.1f);
    EXPECT_EQ(config.adaptive.update_frequency, 10);
    EXPECT_EQ(config.review.scan_limit, 1000);
    EXPECT_EQ(config.writer_threads, 2u);
}

TEST(PipelineConfig, ReadsEverySection) {
    TomlConfig toml;
    toml.load_string(R"(
        [index]
        approximate_threshold = 100
        metric = "l2"
        [matcher]
        match_threshold = 0.5
        auto_review_threshold = 0.45
        unknown_min_confidence = 0.3
        [aggregator]
        window = 5
        max_idle_cycles = 10
        [adaptive]
        alpha = 0.2
        update_frequency = 4
        [review]
        similar_threshold = 0.7
        [database]
        path = "/tmp/x.db"
        [pipeline]
        camera_id = "door"
        log_matches = false
        [logging]
        level = "debug"
    )");

    PipelineConfig config = pipeline_config_from_toml(toml);
    EXPECT_EQ(config.index.approximate_threshold, 100u);
    EXPECT_EQ(config.index.metric, Metric::L2);
    EXPECT_FLOAT_EQ(config.matcher.match_threshold, 0.5f);
    EXPECT_FLOAT_EQ(config.matcher.auto_review_threshold, 0.45f);
    EXPECT_FLOAT_EQ(config.matcher.unknown_min_confidence, 0.3f);
    EXPECT_EQ(config.aggregator.window, 5u);
    EXPECT_EQ(config.aggregator.max_idle_cycles, 10u);
    EXPECT_FLOAT_EQ(config.adaptive.alpha, 0.2f);
    EXPECT_EQ(config.adaptive.update_frequency, 4);
    EXPECT_FLOAT_EQ(config.review.similar_threshold, 0.7f);
    EXPECT_EQ(config.db_path, "/tmp/x.db");
    EXPECT_EQ(config.camera_id, "door");
    EXPECT_FALSE(config.log_matches);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(PipelineConfig, AutoReviewDefaultsBelowMatchThreshold) {
    TomlConfig toml;
    toml.load_string("[matcher]\nmatch_threshold = 0.6\n");
    PipelineConfig config = pipeline_config_from_toml(toml);
    EXPECT_NEAR(config.matcher.auto_review_threshold, 0.5f, 1e-6);
}

TEST(PipelineConfig, ValidationFailures) {
    auto expect_invalid = [](const std::string& content) {
        TomlConfig toml;
        toml.load_string(content);
        EXPECT_THROW(pipeline_config_from_toml(toml), std::invalid_argument) << content;
    };

    expect_invalid("[matcher]\nmatch_threshold = 0.3\nauto_review_threshold = 0.35\n");
    expect_invalid("[matcher]\nunknown_min_confidence = 0.32\n");
    expect_invalid("[matcher]\nmatch_threshold = 1.2\n");
    expect_invalid("[aggregator]\nwindow = 0\n");
    expect_invalid("[adaptive]\nupdate_frequency = 0\n");
    expect_invalid("[adaptive]\nalpha = 1.0\n");
    expect_invalid("[adaptive]\nalpha = 0\n");
    expect_invalid("[index]\nmetric = \"hamming\"\n");
}

TEST(PipelineConfig, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "facewatch_config_test.toml";
    {
        std::ofstream out(path);
        out << "[pipeline]\ncamera_id = \"lobby\"\n";
    }

    PipelineConfig config = load_pipeline_config(path.string());
    EXPECT_EQ(config.camera_id, "lobby");
    std::filesystem::remove(path);

    EXPECT_THROW(load_pipeline_config("/nonexistent/facewatch.toml"), std::runtime_error);
}

TEST(PipelineConfig, LoggingSectionConfiguresLogger) {
    auto dir = std::filesystem::temp_directory_path() / "facewatch_logging_test";
    std::filesystem::remove_all(dir);
    auto log_path = dir / "logs" / "facewatch.log";

    TomlConfig toml;
    toml.load_string("[logging]\nlevel = \"debug\"\nfile = \"" + log_path.string() + "\"\n");
    PipelineConfig config = pipeline_config_from_toml(toml);

    init_logging(config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

    spdlog::warn("logging section check");
    spdlog::default_logger()->flush();

    std::ifstream in(log_path);
    ASSERT_TRUE(in.good());
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("logging section check"), std::string::npos);
    in.close();

    init_logging();
    std::filesystem::remove_all(dir);
}
