#pragma once

#include <string>

namespace vidcount {

// Address of a detection worker speaking the JSON frame protocol.
struct WorkerEndpoint {
    std::string host = "localhost";
    int port = 8001;
    std::string path = "/";

    // JSON field carrying the detection count in a success response.
    std::string count_field = "garbage_count";

    // Accepts http://host[:port][/path]. Throws
    // PipelineError(InvalidConfiguration) on anything else.
    static WorkerEndpoint parse(const std::string& url);

    std::string base_url() const;
    std::string to_string() const;
};

} // namespace vidcount
