#include "errors.hpp"

namespace vidcount {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::SourceNotFound: return "SourceNotFound";
        case ErrorKind::ExtractionFailed: return "ExtractionFailed";
        case ErrorKind::NoFramesProduced: return "NoFramesProduced";
        case ErrorKind::WorkerUnreachable: return "WorkerUnreachable";
        case ErrorKind::WorkerRejectedFrame: return "WorkerRejectedFrame";
        case ErrorKind::MalformedWorkerResponse: return "MalformedWorkerResponse";
        case ErrorKind::NoFramesProcessed: return "NoFramesProcessed";
        case ErrorKind::AllFramesFailed: return "AllFramesFailed";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::WorkerUnreachable;
}

PipelineError::PipelineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace vidcount
