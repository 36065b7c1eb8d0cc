#pragma once

#include "dispatch_coordinator.hpp"
#include "frame_types.hpp"
#include "worker_endpoint.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace vidcount {

struct PipelineConfig {
    std::string video_path;
    SampleSpec sampling;
    WorkerEndpoint worker;
    DispatchOptions dispatch;

    std::string extraction_tool = "auto"; // auto, ffmpeg, opencv
    std::filesystem::path scratch_root;

    // Raise AllFramesFailed instead of returning a report when every frame failed.
    bool fail_on_total_failure = false;

    // Score frames with the in-process simulated model instead of a worker.
    bool simulate = false;

    bool quiet = false;

    // Throws PipelineError(InvalidConfiguration).
    void validate() const;
};

// Text parsers shared by the environment and the command line. Both throw
// PipelineError(InvalidConfiguration) on anything but a clean number.
double parse_step(const std::string& raw);                 // positive seconds
int parse_count(const std::string& raw, const char* name); // non-negative integer

// Reads a JSON object of overrides on top of the defaults. Recognized keys:
// video_path, interval_seconds, max_frames, worker_url, count_field,
// concurrency, retries, timeout_ms, initial_backoff_ms, max_backoff_ms,
// extraction_tool, scratch_dir, fail_on_total_failure, simulate, quiet.
// Unknown keys are ignored; wrong types throw InvalidConfiguration.
PipelineConfig load_config_json(const std::string& path);
void apply_config_json(const nlohmann::json& root, PipelineConfig& config);

// INPUT_PATH, STEP, WORKER_URL, MAX_FRAMES, VIDCOUNT_CONCURRENCY,
// VIDCOUNT_RETRIES. MAX_FRAMES is ignored unless it is all digits.
void apply_env_overrides(PipelineConfig& config);

nlohmann::json config_to_json(const PipelineConfig& config);

} // namespace vidcount
