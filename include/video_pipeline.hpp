#pragma once

#include "aggregator.hpp"
#include "cancellation.hpp"
#include "detection_client.hpp"
#include "extraction_tool.hpp"
#include "pipeline_config.hpp"
#include "video_source.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace vidcount {

// Per-run parameters; unset overrides fall back to the pipeline's config.
struct PipelineRequest {
    SampleSpec sampling;
    WorkerEndpoint worker;
    std::optional<int> concurrency_limit;
    std::optional<int> per_frame_retries;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<bool> fail_on_total_failure;
};

PipelineRequest make_request(const PipelineConfig& config);

// Sample -> dispatch -> aggregate for one video. Holds no per-run state, so
// one instance may serve concurrent runs.
class VideoPipeline {
public:
    // Builds the extraction tool and detection client the config asks for.
    explicit VideoPipeline(const PipelineConfig& config = {});

    VideoPipeline(const PipelineConfig& config,
                  std::shared_ptr<ExtractionTool> tool,
                  std::shared_ptr<DetectionClient> client);

    ~VideoPipeline();

    // Sampler errors (InvalidConfiguration, SourceNotFound, ExtractionFailed,
    // NoFramesProduced) abort before any dispatch. Per-frame failures land in
    // the report. Throws AllFramesFailed only when fail_on_total_failure is
    // set and no frame was skipped, and Cancelled when cancellation arrives
    // before any frame is sent.
    Report run(const VideoSource& video, const PipelineRequest& request, CancellationToken& cancel);
    Report run(const VideoSource& video, const PipelineRequest& request);

    const PipelineConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vidcount
