#pragma once

#include "frame_types.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace vidcount {

class Report;

// Folds per-frame outcomes into a Report. Failed frames add 0 to the total
// and are counted separately; Cancelled outcomes count as skipped, not
// processed. The report is partial when `cancelled` is set or any frame was
// skipped. Throws PipelineError(NoFramesProcessed) when nothing was
// processed. Pure: no I/O, deterministic.
Report aggregate(std::vector<FrameOutcome> outcomes, bool cancelled = false);

// Summary of one pipeline run. Built only by aggregate(); read-only after.
class Report {
public:
    int total_frames() const { return total_frames_; }
    int frames_processed() const { return frames_processed_; }
    int successful_frames() const { return successful_frames_; }
    int failed_frame_count() const { return failed_frame_count_; }
    int skipped_frame_count() const { return skipped_frame_count_; }
    long long total_detections() const { return total_detections_; }
    double average_per_frame() const { return average_per_frame_; }
    bool partial() const { return partial_; }

    // Ordered by frame index; one entry per sampled frame.
    const std::vector<FrameOutcome>& outcomes() const { return outcomes_; }

private:
    friend Report aggregate(std::vector<FrameOutcome> outcomes, bool cancelled);

    Report() = default;

    int total_frames_ = 0;
    int frames_processed_ = 0;
    int successful_frames_ = 0;
    int failed_frame_count_ = 0;
    int skipped_frame_count_ = 0;
    long long total_detections_ = 0;
    double average_per_frame_ = 0.0;
    bool partial_ = false;
    std::vector<FrameOutcome> outcomes_;
};

nlohmann::json outcome_to_json(const FrameOutcome& outcome);
nlohmann::json report_to_json(const Report& report);

} // namespace vidcount
