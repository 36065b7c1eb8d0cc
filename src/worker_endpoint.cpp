#include "worker_endpoint.hpp"
#include "errors.hpp"

#include <cctype>

namespace vidcount {

namespace {

[[noreturn]] void invalid_url(const std::string& url, const std::string& reason) {
    throw PipelineError(ErrorKind::InvalidConfiguration,
                        "Invalid worker URL '" + url + "': " + reason);
}

} // namespace

WorkerEndpoint WorkerEndpoint::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        invalid_url(url, "expected http://host[:port][/path]");
    }

    const std::string rest = url.substr(scheme.size());
    const size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    const std::string path = slash == std::string::npos ? "/" : rest.substr(slash);

    if (authority.empty()) {
        invalid_url(url, "missing host");
    }

    WorkerEndpoint endpoint;
    endpoint.path = path;

    const size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = authority;
        endpoint.port = 80;
    } else {
        endpoint.host = authority.substr(0, colon);
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5) {
            invalid_url(url, "bad port");
        }
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                invalid_url(url, "bad port");
            }
        }
        endpoint.port = std::stoi(port);
        if (endpoint.port < 1 || endpoint.port > 65535) {
            invalid_url(url, "port out of range");
        }
    }

    if (endpoint.host.empty()) {
        invalid_url(url, "missing host");
    }
    return endpoint;
}

std::string WorkerEndpoint::base_url() const {
    return "http://" + host + ":" + std::to_string(port);
}

std::string WorkerEndpoint::to_string() const {
    return base_url() + path;
}

} // namespace vidcount
