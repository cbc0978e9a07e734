#include "rep/temp_filenames.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace strata::rep {

TempFilenameFactory::TempFilenameFactory(fs::path root) : root_(std::move(root)) {}

fs::path TempFilenameFactory::create(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    fs::path dir = root_ / prefix;
    if (std::find(prefix_dirs_.begin(), prefix_dirs_.end(), dir) == prefix_dirs_.end()) {
        prefix_dirs_.push_back(dir);
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        STRATA_LOG_WARN("rep", "Cannot create temporary directory " << dir.string() << ": "
                                                                     << ec.message());
    }

    // Leftovers from an earlier run or another factory on the same root are
    // never handed out
    fs::path path = dir / ("tmp." + std::to_string(counter_++));
    while (fs::exists(path, ec)) {
        STRATA_LOG_DEBUG("rep", "Skipping existing temporary file " << path.string());
        path = dir / ("tmp." + std::to_string(counter_++));
    }
    ++created_;
    return path;
}

void TempFilenameFactory::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& dir : prefix_dirs_) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            STRATA_LOG_WARN("rep", "Cannot remove temporary directory " << dir.string() << ": "
                                                                         << ec.message());
        }
    }
    prefix_dirs_.clear();

    // Drop the root too once nothing else lives in it
    std::error_code ec;
    if (fs::is_directory(root_, ec) && fs::is_empty(root_, ec)) {
        fs::remove(root_, ec);
    }
}

size_t TempFilenameFactory::created_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

} // namespace strata::rep
