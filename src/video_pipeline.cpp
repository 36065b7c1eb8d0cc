#include "video_pipeline.hpp"

#include "console.hpp"
#include "dispatch_coordinator.hpp"
#include "frame_sampler.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace vidcount {

namespace {

std::shared_ptr<ExtractionTool> make_tool(const PipelineConfig& config) {
    if (config.extraction_tool == "auto") {
        return create_best_extraction_tool();
    }
    return create_extraction_tool(config.extraction_tool);
}

std::shared_ptr<DetectionClient> make_client(const PipelineConfig& config) {
    if (config.simulate) {
        return std::make_shared<LocalDetectionClient>(std::make_shared<SimulatedDetectionModel>());
    }
    return std::make_shared<HttpDetectionClient>();
}

} // namespace

PipelineRequest make_request(const PipelineConfig& config) {
    PipelineRequest request;
    request.sampling = config.sampling;
    request.worker = config.worker;
    request.concurrency_limit = config.dispatch.concurrency_limit;
    request.per_frame_retries = config.dispatch.retry.per_frame_retries;
    request.timeout = config.dispatch.timeout;
    request.fail_on_total_failure = config.fail_on_total_failure;
    return request;
}

class VideoPipeline::Impl {
public:
    Impl(const PipelineConfig& config,
         std::shared_ptr<ExtractionTool> tool,
         std::shared_ptr<DetectionClient> client)
        : config_(config),
          client_(std::move(client)),
          sampler_(std::move(tool), SamplerOptions{config.scratch_root, !config.quiet}) {}

    Report run(const VideoSource& video, const PipelineRequest& request, CancellationToken& cancel) {
        DispatchOptions options = config_.dispatch;
        options.verbose = !config_.quiet;
        if (request.concurrency_limit) options.concurrency_limit = *request.concurrency_limit;
        if (request.per_frame_retries) options.retry.per_frame_retries = *request.per_frame_retries;
        if (request.timeout) options.timeout = *request.timeout;
        options.validate();

        const bool fail_fast = request.fail_on_total_failure.value_or(config_.fail_on_total_failure);

        // Scratch files live until `frames` goes out of scope, on every path.
        FrameSequence frames = sampler_.sample(video, request.sampling);

        // A token cancelled before or during sampling stops every dispatch
        // task before it sends anything.
        DispatchCoordinator coordinator(client_, options);
        DispatchResult result = coordinator.run(frames.frames(), request.worker, cancel);

        int attempted = 0;
        int failures = 0;
        const FrameOutcome* first_failure = nullptr;
        for (const auto& outcome : result.outcomes) {
            if (outcome.error_kind == ErrorKind::Cancelled) continue;
            ++attempted;
            if (!outcome.ok()) {
                ++failures;
                if (!first_failure) first_failure = &outcome;
            }
        }
        const int skipped = static_cast<int>(result.outcomes.size()) - attempted;

        if (result.cancelled && attempted == 0) {
            throw PipelineError(ErrorKind::Cancelled, "run cancelled before any frame was dispatched");
        }

        // Frames skipped by cancellation never had a chance to succeed, so a
        // cancelled run always ends in a partial report.
        if (fail_fast && skipped == 0 && failures == attempted) {
            throw PipelineError(ErrorKind::AllFramesFailed,
                                "all " + std::to_string(failures) + " frames failed (first: " +
                                    to_string(first_failure->error_kind) + ": " +
                                    first_failure->error_message + ")");
        }

        Report report = aggregate(std::move(result.outcomes), result.cancelled);

        if (!config_.quiet) {
            std::ostringstream summary;
            summary << "Processed " << report.frames_processed() << "/" << report.total_frames()
                    << " frames, " << report.total_detections() << " detections, average "
                    << std::fixed << std::setprecision(2) << report.average_per_frame()
                    << " per frame";
            if (report.failed_frame_count() > 0) summary << ", " << report.failed_frame_count() << " failed";
            if (report.partial()) summary << " (partial)";
            log_info("pipeline", summary.str());
        }
        return report;
    }

    PipelineConfig config_;
    std::shared_ptr<DetectionClient> client_;
    FrameSampler sampler_;
};

VideoPipeline::VideoPipeline(const PipelineConfig& config)
    : pimpl_(std::make_unique<Impl>(config, make_tool(config), make_client(config))) {}

VideoPipeline::VideoPipeline(const PipelineConfig& config,
                             std::shared_ptr<ExtractionTool> tool,
                             std::shared_ptr<DetectionClient> client)
    : pimpl_(std::make_unique<Impl>(config, std::move(tool), std::move(client))) {}

VideoPipeline::~VideoPipeline() = default;

Report VideoPipeline::run(const VideoSource& video, const PipelineRequest& request, CancellationToken& cancel) {
    return pimpl_->run(video, request, cancel);
}

Report VideoPipeline::run(const VideoSource& video, const PipelineRequest& request) {
    CancellationToken cancel;
    return pimpl_->run(video, request, cancel);
}

const PipelineConfig& VideoPipeline::config() const {
    return pimpl_->config_;
}

} // namespace vidcount
