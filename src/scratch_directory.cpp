#include "scratch_directory.hpp"
#include "console.hpp"

#include <chrono>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace vidcount {

namespace fs = std::filesystem;

ScratchDirectory::ScratchDirectory(const std::string& prefix, const fs::path& parent) {
    std::error_code ec;
    const fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
    if (ec) {
        throw std::runtime_error("No temporary directory available: " + ec.message());
    }

    std::random_device rd;
    std::mt19937_64 gen(rd() ^ static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()));

    for (int attempt = 0; attempt < 16; ++attempt) {
        const fs::path candidate = base / (prefix + std::to_string(gen() % 1000000000ULL));
        if (fs::create_directory(candidate, ec)) {
            path_ = candidate;
            return;
        }
        if (ec) {
            throw std::runtime_error("Failed to create scratch directory " +
                                     candidate.string() + ": " + ec.message());
        }
    }
    throw std::runtime_error("Failed to create a unique scratch directory under " + base.string());
}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScratchDirectory::remove() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warn("scratch", "failed to remove " + path_.string() + ": " + ec.message());
    }
    path_.clear();
}

} // namespace vidcount
