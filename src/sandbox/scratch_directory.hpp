#pragma once

#include <filesystem>
#include <string>

namespace autolab::sandbox {

// Private per-run directory tree, removed when the object goes out of scope:
//   <root>/<label>-<unique>/        captured stdout/stderr
//   <root>/<label>-<unique>/work/   the program's working directory
class ScratchDirectory {
public:
    ScratchDirectory(const std::filesystem::path& root, const std::string& label);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::filesystem::path WorkDir() const { return path_ / "work"; }
    std::filesystem::path StdoutPath() const { return path_ / "stdout.log"; }
    std::filesystem::path StderrPath() const { return path_ / "stderr.log"; }

private:
    std::filesystem::path path_;
};

}  // namespace autolab::sandbox
