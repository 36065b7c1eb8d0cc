#include "pipeline_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace vidcount {

namespace {

[[noreturn]] void config_error(const std::string& message) {
    throw PipelineError(ErrorKind::InvalidConfiguration, message);
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

} // namespace

double parse_step(const std::string& raw) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &consumed);
    } catch (const std::logic_error&) {
        config_error("Invalid step value '" + raw + "'. Must be a positive number.");
    }
    if (consumed != raw.size() || !(value > 0.0)) {
        config_error("Invalid step value '" + raw + "'. Must be a positive number.");
    }
    return value;
}

int parse_count(const std::string& raw, const char* name) {
    if (!all_digits(raw) || raw.size() > 9) {
        config_error(std::string(name) + " must be a non-negative integer (got '" + raw + "')");
    }
    return std::stoi(raw);
}

void PipelineConfig::validate() const {
    sampling.validate();
    dispatch.validate();
    if (extraction_tool != "auto" && extraction_tool != "ffmpeg" && extraction_tool != "opencv") {
        config_error("extraction_tool must be auto, ffmpeg or opencv (got '" + extraction_tool + "')");
    }
    if (worker.count_field.empty()) {
        config_error("count_field must not be empty");
    }
}

void apply_config_json(const json& root, PipelineConfig& config) {
    if (!root.is_object()) {
        config_error("configuration must be a JSON object");
    }

    try {
        if (root.contains("video_path")) config.video_path = root.at("video_path").get<std::string>();
        if (root.contains("interval_seconds")) config.sampling.interval_seconds = root.at("interval_seconds").get<double>();
        if (root.contains("max_frames")) {
            if (root.at("max_frames").is_null()) {
                config.sampling.max_frames.reset();
            } else {
                config.sampling.max_frames = root.at("max_frames").get<int>();
            }
        }
        if (root.contains("worker_url")) {
            const std::string field = config.worker.count_field;
            config.worker = WorkerEndpoint::parse(root.at("worker_url").get<std::string>());
            config.worker.count_field = field;
        }
        if (root.contains("count_field")) config.worker.count_field = root.at("count_field").get<std::string>();
        if (root.contains("concurrency")) config.dispatch.concurrency_limit = root.at("concurrency").get<int>();
        if (root.contains("retries")) config.dispatch.retry.per_frame_retries = root.at("retries").get<int>();
        if (root.contains("timeout_ms")) {
            config.dispatch.timeout = std::chrono::milliseconds(root.at("timeout_ms").get<long long>());
        }
        if (root.contains("initial_backoff_ms")) {
            config.dispatch.retry.initial_backoff = std::chrono::milliseconds(root.at("initial_backoff_ms").get<long long>());
        }
        if (root.contains("max_backoff_ms")) {
            config.dispatch.retry.max_backoff = std::chrono::milliseconds(root.at("max_backoff_ms").get<long long>());
        }
        if (root.contains("extraction_tool")) config.extraction_tool = root.at("extraction_tool").get<std::string>();
        if (root.contains("scratch_dir")) config.scratch_root = root.at("scratch_dir").get<std::string>();
        if (root.contains("fail_on_total_failure")) config.fail_on_total_failure = root.at("fail_on_total_failure").get<bool>();
        if (root.contains("simulate")) config.simulate = root.at("simulate").get<bool>();
        if (root.contains("quiet")) config.quiet = root.at("quiet").get<bool>();
    } catch (const json::exception& e) {
        config_error(std::string("invalid configuration value: ") + e.what());
    }
}

PipelineConfig load_config_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        config_error("Cannot open config file: " + path);
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        config_error("Config file is not valid JSON: " + path);
    }

    PipelineConfig config;
    apply_config_json(root, config);
    return config;
}

void apply_env_overrides(PipelineConfig& config) {
    if (const char* v = env("INPUT_PATH")) {
        config.video_path = v;
    }
    if (const char* v = env("STEP")) {
        config.sampling.interval_seconds = parse_step(v);
    }
    if (const char* v = env("WORKER_URL")) {
        const std::string field = config.worker.count_field;
        config.worker = WorkerEndpoint::parse(v);
        config.worker.count_field = field;
    }
    if (const char* v = env("MAX_FRAMES")) {
        // Non-numeric values are ignored rather than rejected.
        if (all_digits(v) && std::string(v).size() <= 9) {
            const int max_frames = std::stoi(v);
            if (max_frames > 0) {
                config.sampling.max_frames = max_frames;
            }
        }
    }
    if (const char* v = env("VIDCOUNT_CONCURRENCY")) {
        config.dispatch.concurrency_limit = parse_count(v, "VIDCOUNT_CONCURRENCY");
    }
    if (const char* v = env("VIDCOUNT_RETRIES")) {
        config.dispatch.retry.per_frame_retries = parse_count(v, "VIDCOUNT_RETRIES");
    }
}

json config_to_json(const PipelineConfig& config) {
    json j;
    j["video_path"] = config.video_path;
    j["interval_seconds"] = config.sampling.interval_seconds;
    j["max_frames"] = config.sampling.max_frames ? json(*config.sampling.max_frames) : json(nullptr);
    j["worker_url"] = config.worker.to_string();
    j["count_field"] = config.worker.count_field;
    j["concurrency"] = config.dispatch.concurrency_limit;
    j["retries"] = config.dispatch.retry.per_frame_retries;
    j["timeout_ms"] = config.dispatch.timeout.count();
    j["initial_backoff_ms"] = config.dispatch.retry.initial_backoff.count();
    j["max_backoff_ms"] = config.dispatch.retry.max_backoff.count();
    j["extraction_tool"] = config.extraction_tool;
    j["scratch_dir"] = config.scratch_root.string();
    j["fail_on_total_failure"] = config.fail_on_total_failure;
    j["simulate"] = config.simulate;
    j["quiet"] = config.quiet;
    return j;
}

} // namespace vidcount
