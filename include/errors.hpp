#pragma once

#include <stdexcept>
#include <string>

namespace vidcount {

enum class ErrorKind {
    None,
    InvalidConfiguration,
    SourceNotFound,
    ExtractionFailed,
    NoFramesProduced,
    WorkerUnreachable,
    WorkerRejectedFrame,
    MalformedWorkerResponse,
    NoFramesProcessed,
    AllFramesFailed,
    Cancelled
};

// Stable names used in logs and in the JSON report.
const char* to_string(ErrorKind kind);

// Only WorkerUnreachable is worth another attempt.
bool is_retryable(ErrorKind kind);

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace vidcount
