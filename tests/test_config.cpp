#include <gtest/gtest.h>
#include "pipeline_config.hpp"
#include "test_support.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace vidcount {

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_path_ = testing_support::per_test_name("vidcount_config", ".json");
        clear_env();
    }

    void TearDown() override {
        clear_env();
        std::remove(config_path_.c_str());
    }

    static void clear_env() {
        for (const char* name : {"INPUT_PATH", "STEP", "WORKER_URL", "MAX_FRAMES",
                                 "VIDCOUNT_CONCURRENCY", "VIDCOUNT_RETRIES"}) {
            unsetenv(name);
        }
    }

    void write_config(const std::string& text) {
        std::ofstream file(config_path_);
        file << text;
    }

    std::string config_path_;
};

TEST_F(PipelineConfigTest, Defaults) {
    PipelineConfig config;
    EXPECT_DOUBLE_EQ(config.sampling.interval_seconds, 1.0);
    EXPECT_FALSE(config.sampling.max_frames.has_value());
    EXPECT_EQ(config.worker.to_string(), "http://localhost:8001/");
    EXPECT_EQ(config.worker.count_field, "garbage_count");
    EXPECT_EQ(config.dispatch.concurrency_limit, 2);
    EXPECT_EQ(config.dispatch.retry.per_frame_retries, 2);
    EXPECT_EQ(config.dispatch.timeout.count(), 30000);
    EXPECT_EQ(config.extraction_tool, "auto");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(PipelineConfigTest, EndpointParsing) {
    auto endpoint = WorkerEndpoint::parse("http://10.0.0.5:9000/predict");
    EXPECT_EQ(endpoint.host, "10.0.0.5");
    EXPECT_EQ(endpoint.port, 9000);
    EXPECT_EQ(endpoint.path, "/predict");
    EXPECT_EQ(endpoint.base_url(), "http://10.0.0.5:9000");

    auto bare = WorkerEndpoint::parse("http://worker");
    EXPECT_EQ(bare.port, 80);
    EXPECT_EQ(bare.path, "/");

    for (const char* url : {"https://worker:8001/", "worker:8001", "http://", "http://:8001/",
                            "http://worker:abc/", "http://worker:70000/", "http://worker:/"}) {
        try {
            WorkerEndpoint::parse(url);
            FAIL() << "expected InvalidConfiguration for " << url;
        } catch (const PipelineError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration) << url;
        }
    }
}

TEST_F(PipelineConfigTest, LoadsJsonFile) {
    write_config(R"({
        "video_path": "clips/street.mp4",
        "interval_seconds": 2.5,
        "max_frames": 8,
        "worker_url": "http://gpu-box:8001/",
        "count_field": "people",
        "concurrency": 4,
        "retries": 1,
        "timeout_ms": 5000,
        "extraction_tool": "opencv",
        "fail_on_total_failure": true,
        "unknown_key": "ignored"
    })");

    auto config = load_config_json(config_path_);
    EXPECT_EQ(config.video_path, "clips/street.mp4");
    EXPECT_DOUBLE_EQ(config.sampling.interval_seconds, 2.5);
    EXPECT_EQ(config.sampling.max_frames.value(), 8);
    EXPECT_EQ(config.worker.host, "gpu-box");
    EXPECT_EQ(config.worker.count_field, "people");
    EXPECT_EQ(config.dispatch.concurrency_limit, 4);
    EXPECT_EQ(config.dispatch.retry.per_frame_retries, 1);
    EXPECT_EQ(config.dispatch.timeout.count(), 5000);
    EXPECT_EQ(config.extraction_tool, "opencv");
    EXPECT_TRUE(config.fail_on_total_failure);
    EXPECT_NO_THROW(config.validate());

    auto round_trip = config_to_json(config);
    EXPECT_EQ(round_trip["worker_url"], "http://gpu-box:8001/");
    EXPECT_EQ(round_trip["max_frames"], 8);
}

TEST_F(PipelineConfigTest, BadJsonRejected) {
    write_config("{ not json");
    EXPECT_THROW(load_config_json(config_path_), PipelineError);

    write_config(R"({"interval_seconds": "fast"})");
    try {
        load_config_json(config_path_);
        FAIL() << "expected InvalidConfiguration";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
    }

    EXPECT_THROW(load_config_json("no_such_config.json"), PipelineError);
}

TEST_F(PipelineConfigTest, EnvironmentOverrides) {
    setenv("INPUT_PATH", "/data/video.mp4", 1);
    setenv("STEP", "0.5", 1);
    setenv("WORKER_URL", "http://model:8080/", 1);
    setenv("MAX_FRAMES", "12", 1);
    setenv("VIDCOUNT_CONCURRENCY", "3", 1);

    PipelineConfig config;
    config.worker.count_field = "people";
    apply_env_overrides(config);

    EXPECT_EQ(config.video_path, "/data/video.mp4");
    EXPECT_DOUBLE_EQ(config.sampling.interval_seconds, 0.5);
    EXPECT_EQ(config.worker.host, "model");
    EXPECT_EQ(config.worker.port, 8080);
    EXPECT_EQ(config.worker.count_field, "people");
    EXPECT_EQ(config.sampling.max_frames.value(), 12);
    EXPECT_EQ(config.dispatch.concurrency_limit, 3);
}

TEST_F(PipelineConfigTest, NonNumericMaxFramesIgnored) {
    setenv("MAX_FRAMES", "ten", 1);
    PipelineConfig config;
    apply_env_overrides(config);
    EXPECT_FALSE(config.sampling.max_frames.has_value());

    setenv("MAX_FRAMES", "0", 1);
    apply_env_overrides(config);
    EXPECT_FALSE(config.sampling.max_frames.has_value());
}

TEST_F(PipelineConfigTest, BadStepRejected) {
    for (const char* step : {"abc", "-1", "0", "2s"}) {
        setenv("STEP", step, 1);
        PipelineConfig config;
        try {
            apply_env_overrides(config);
            FAIL() << "expected InvalidConfiguration for STEP=" << step;
        } catch (const PipelineError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
            EXPECT_NE(std::string(e.what()).find("Must be a positive number"), std::string::npos);
        }
    }
}

TEST(CommandLineValueTest, NumbersParsedOrRejectedAsConfiguration) {
    EXPECT_DOUBLE_EQ(parse_step("0.5"), 0.5);
    EXPECT_DOUBLE_EQ(parse_step("3"), 3.0);
    EXPECT_EQ(parse_count("0", "--retries"), 0);
    EXPECT_EQ(parse_count("16", "--concurrency"), 16);

    for (const char* raw : {"", "fast", "1.5.2", "-0.5"}) {
        try {
            parse_step(raw);
            FAIL() << "expected InvalidConfiguration for --step " << raw;
        } catch (const PipelineError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
        }
    }
    for (const char* raw : {"", "four", "-2", "3x", "1e3", "99999999999"}) {
        try {
            parse_count(raw, "--max-frames");
            FAIL() << "expected InvalidConfiguration for --max-frames " << raw;
        } catch (const PipelineError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
            EXPECT_NE(std::string(e.what()).find("--max-frames"), std::string::npos);
        }
    }
}

TEST_F(PipelineConfigTest, ValidateRejectsBadValues) {
    PipelineConfig config;
    config.extraction_tool = "vlc";
    EXPECT_THROW(config.validate(), PipelineError);

    config = PipelineConfig{};
    config.dispatch.concurrency_limit = 0;
    EXPECT_THROW(config.validate(), PipelineError);

    config = PipelineConfig{};
    config.sampling.max_frames = -3;
    EXPECT_THROW(config.validate(), PipelineError);

    config = PipelineConfig{};
    config.worker.count_field.clear();
    EXPECT_THROW(config.validate(), PipelineError);
}

} // namespace vidcount
