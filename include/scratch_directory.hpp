#pragma once

#include <filesystem>
#include <string>

namespace vidcount {

// Uniquely named temporary directory, removed with its contents exactly once
// when the owning object is destroyed.
class ScratchDirectory {
public:
    // Creates <parent>/<prefix><unique suffix>. An empty parent means the
    // system temporary directory. Throws std::runtime_error on failure.
    explicit ScratchDirectory(const std::string& prefix = "vidcount_frames_",
                              const std::filesystem::path& parent = {});
    ~ScratchDirectory();

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    void remove() noexcept;

    std::filesystem::path path_;
};

} // namespace vidcount
