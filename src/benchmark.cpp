#include "aggregator.hpp"
#include "base64.hpp"
#include "dispatch_coordinator.hpp"
#include "extraction_tool.hpp"
#include "frame_sampler.hpp"
#include "video_pipeline.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <thread>
#include <opencv2/opencv.hpp>
#include <iostream>

namespace vidcount {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        create_synthetic_video();
        frames_ = make_frames(32);
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        frames_.clear();
        std::remove("benchmark_video.avi");
    }

protected:
    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        if (!writer.open("benchmark_video.avi", fourcc, 30.0, cv::Size(640, 360))) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        std::mt19937 gen(7);
        std::uniform_int_distribution<> dis(0, 255);

        // 20 seconds at 30fps
        for (int i = 0; i < 600; ++i) {
            cv::Mat frame = cv::Mat::zeros(360, 640, CV_8UC3);
            for (int y = 0; y < frame.rows; y += 40) {
                for (int x = 0; x < frame.cols; x += 40) {
                    cv::rectangle(frame, cv::Point(x, y), cv::Point(x + 38, y + 38),
                                  cv::Scalar(dis(gen), dis(gen), dis(gen)), -1);
                }
            }
            int circle_x = (i * 5) % frame.cols;
            int circle_y = 180 + static_cast<int>(60 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 30, cv::Scalar(255, 255, 255), -1);
            writer << frame;
        }
        writer.release();
    }

    static std::vector<Frame> make_frames(int count) {
        cv::Mat image(360, 640, CV_8UC3);
        cv::randu(image, cv::Scalar(0, 0, 0), cv::Scalar(255, 255, 255));
        std::vector<unsigned char> jpeg;
        cv::imencode(".jpg", image, jpeg);

        std::vector<Frame> frames;
        for (int i = 0; i < count; ++i) {
            Frame frame;
            frame.index = i + 1;
            frame.timestamp_seconds = i;
            frame.name = frame_display_name(i + 1);
            frame.bytes = jpeg;
            frames.push_back(std::move(frame));
        }
        return frames;
    }

    std::vector<Frame> frames_;
};

// In-process sampling, one frame per second
BENCHMARK_DEFINE_F(BenchmarkFixture, OpenCvSampling)(benchmark::State& state) {
    FrameSampler sampler(std::make_shared<OpenCvExtractionTool>(), SamplerOptions{{}, false});
    auto video = VideoSource::open("benchmark_video.avi");

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto frames = sampler.sample(video, SampleSpec{1.0, std::nullopt});

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(frames.size());
    }
}

// Dispatch against a simulated 5ms model at increasing concurrency
BENCHMARK_DEFINE_F(BenchmarkFixture, DispatchConcurrency)(benchmark::State& state) {
    auto model = std::make_shared<SimulatedDetectionModel>(1, 5, std::chrono::milliseconds(5));
    DispatchOptions options;
    options.concurrency_limit = static_cast<int>(state.range(0));
    options.verbose = false;
    DispatchCoordinator coordinator(std::make_shared<LocalDetectionClient>(model), options);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = coordinator.run(frames_, WorkerEndpoint{});

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["concurrency"] = static_cast<double>(options.concurrency_limit);
        state.counters["frames_per_second"] = static_cast<double>(result.outcomes.size()) / elapsed_seconds.count();
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, RequestEncoding)(benchmark::State& state) {
    size_t bytes = 0;
    for (auto _ : state) {
        for (const auto& frame : frames_) {
            auto body = build_worker_request(frame);
            bytes += body.size();
            benchmark::DoNotOptimize(body);
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
}

BENCHMARK_DEFINE_F(BenchmarkFixture, Aggregation)(benchmark::State& state) {
    std::vector<FrameOutcome> outcomes;
    Frame frame;
    for (int i = 0; i < state.range(0); ++i) {
        frame.index = i + 1;
        frame.name = frame_display_name(i + 1);
        outcomes.push_back(i % 10 == 0
            ? FrameOutcome::failure(frame, ErrorKind::WorkerRejectedFrame, "rejected")
            : FrameOutcome::success(frame, i % 6));
    }

    for (auto _ : state) {
        auto report = aggregate(outcomes);
        benchmark::DoNotOptimize(report.total_detections());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Sample, dispatch and aggregate with the simulated model
BENCHMARK_DEFINE_F(BenchmarkFixture, FullPipeline)(benchmark::State& state) {
    PipelineConfig config;
    config.quiet = true;
    config.dispatch.concurrency_limit = 4;
    auto model = std::make_shared<SimulatedDetectionModel>(1, 5, std::chrono::milliseconds(2));
    VideoPipeline pipeline(config,
                           std::make_shared<OpenCvExtractionTool>(),
                           std::make_shared<LocalDetectionClient>(model));
    auto video = VideoSource::open("benchmark_video.avi");
    PipelineRequest request = make_request(config);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto report = pipeline.run(video, request);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(report.total_frames());
        state.counters["average"] = report.average_per_frame();
    }
}

BENCHMARK_REGISTER_F(BenchmarkFixture, OpenCvSampling)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, DispatchConcurrency)->RangeMultiplier(2)->Range(1, 8)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, RequestEncoding)->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, Aggregation)->Range(8, 4096)->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, FullPipeline)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace vidcount

int main(int argc, char** argv) {
    std::cout << "vidcount - Performance Benchmarks" << std::endl;
    std::cout << "=================================" << std::endl;
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;

    auto tools = vidcount::get_available_extraction_tools();
    std::cout << "  Available Extraction Tools: ";
    for (size_t i = 0; i < tools.size(); ++i) {
        std::cout << tools[i];
        if (i < tools.size() - 1) std::cout << ", ";
    }
    std::cout << std::endl << std::endl;

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
