#include "aggregator.hpp"

#include <utility>

using json = nlohmann::json;

namespace vidcount {

Report aggregate(std::vector<FrameOutcome> outcomes, bool cancelled) {
    if (outcomes.empty()) {
        throw PipelineError(ErrorKind::NoFramesProcessed, "cannot aggregate an empty set of frame outcomes");
    }

    Report report;
    for (const auto& outcome : outcomes) {
        if (outcome.ok()) {
            ++report.successful_frames_;
            report.total_detections_ += outcome.detection_count;
        } else if (outcome.error_kind == ErrorKind::Cancelled) {
            ++report.skipped_frame_count_;
        } else {
            ++report.failed_frame_count_;
        }
    }

    report.total_frames_ = static_cast<int>(outcomes.size());
    report.frames_processed_ = report.successful_frames_ + report.failed_frame_count_;
    if (report.frames_processed_ == 0) {
        throw PipelineError(ErrorKind::NoFramesProcessed,
                            "none of the " + std::to_string(outcomes.size()) + " frames was processed");
    }

    report.average_per_frame_ = static_cast<double>(report.total_detections_) / report.frames_processed_;
    report.partial_ = cancelled || report.skipped_frame_count_ > 0;
    report.outcomes_ = std::move(outcomes);
    return report;
}

json outcome_to_json(const FrameOutcome& outcome) {
    json j;
    j["frame"] = outcome.frame_name;
    j["index"] = outcome.frame_index;
    j["attempts"] = outcome.attempts;
    j["elapsed_ms"] = outcome.elapsed.count();
    if (outcome.ok()) {
        j["detections"] = outcome.detection_count;
    } else {
        j["error_kind"] = to_string(outcome.error_kind);
        j["error"] = outcome.error_message;
    }
    return j;
}

json report_to_json(const Report& report) {
    json j;
    j["ok"] = true;
    j["partial"] = report.partial();
    j["total_frames"] = report.total_frames();
    j["frames_processed"] = report.frames_processed();
    j["successful_frames"] = report.successful_frames();
    j["failed_frame_count"] = report.failed_frame_count();
    j["skipped_frame_count"] = report.skipped_frame_count();
    j["total_detections"] = report.total_detections();
    j["average_per_frame"] = report.average_per_frame();

    json frames = json::array();
    for (const auto& outcome : report.outcomes()) {
        frames.push_back(outcome_to_json(outcome));
    }
    j["frame_results"] = frames;
    return j;
}

} // namespace vidcount
