#pragma once

#include <cstdlib>
#include <dirent.h>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

// Directory created for a single test; the scratch files of runs are expected to be removed by
// the code under test, so only an empty directory is removed on destruction
class TemporaryDirectory {
    std::string path_;

public:
    TemporaryDirectory() {
        std::string templ = "/tmp/trialbox-test.XXXXXX";
        if (mkdtemp(templ.data()) == nullptr) {
            throw std::runtime_error("mkdtemp() failed");
        }
        path_ = templ;
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

    ~TemporaryDirectory() { (void)rmdir(path_.c_str()); }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] std::vector<std::string> entries() const {
        std::vector<std::string> res;
        DIR* dir = opendir(path_.c_str());
        if (dir == nullptr) {
            throw std::runtime_error("opendir() failed");
        }
        while (auto* entry = readdir(dir)) {
            std::string name = entry->d_name;
            if (name != "." and name != "..") {
                res.emplace_back(std::move(name));
            }
        }
        closedir(dir);
        return res;
    }
};
