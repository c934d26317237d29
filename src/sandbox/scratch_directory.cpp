#include "sandbox/scratch_directory.hpp"

#include <atomic>
#include <chrono>
#include <system_error>
#include <unistd.h>

#include "utils/logging.hpp"

namespace autolab::sandbox {
namespace {

std::string UniqueSuffix() {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + "-" + std::to_string(stamp);
}

}  // namespace

ScratchDirectory::ScratchDirectory(const std::filesystem::path& root, const std::string& label) {
    std::filesystem::create_directories(root);
    path_ = root / (label + "-" + UniqueSuffix());
    // create_directory reports false for an existing path; a collision must not share state.
    if (!std::filesystem::create_directory(path_)) {
        throw std::filesystem::filesystem_error(
            "scratch directory already exists", path_,
            std::make_error_code(std::errc::file_exists));
    }
    std::filesystem::create_directory(WorkDir());
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::LogWarn("sandbox", "failed to remove scratch directory",
                       {{"path", path_.string()}, {"error", ec.message()}});
    }
}

}  // namespace autolab::sandbox
