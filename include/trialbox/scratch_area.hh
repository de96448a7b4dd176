#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace trialbox {

// Directory of a single run inside the scratch area. It holds the program file and serves as
// the working directory of the run, so it collects every file the run creates. It is removed
// together with its contents on destruction (errors are ignored) or by ScratchArea::release().
class ScratchDir {
    std::string path_;

public:
    ScratchDir() noexcept = default;

    explicit ScratchDir(std::string path) noexcept
    : path_{std::move(path)} {}

    ScratchDir(const ScratchDir&) = delete;

    ScratchDir(ScratchDir&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    ~ScratchDir();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Throws on error
    void remove();
};

// The single directory holding files of sandboxed runs. Every failure is reported as
// ScratchAreaError.
class ScratchArea {
    std::string dir_;

public:
    // Creates the directory (mode 0700) unless it exists
    explicit ScratchArea(std::string dir);

    [[nodiscard]] const std::string& path() const noexcept { return dir_; }

    // Creates a new uniquely named directory (mode 0700) with @p contents written to file
    // @p file_name inside it
    [[nodiscard]] ScratchDir materialize(std::string_view contents, std::string_view file_name);

    // Removes the directory created by materialize() with everything the run left in it
    void release(ScratchDir&& dir);
};

} // namespace trialbox
