//! # Temporary Filenames
//!
//! Hands out fresh paths for binary filter output. Paths live under
//! `<root>/<prefix>/` and are never reused within one factory. A path that
//! already exists on disk is skipped.

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace strata::rep {

class TempFilenameFactory {
public:
    explicit TempFilenameFactory(std::filesystem::path root);

    /// Returns a new path `<root>/<prefix>/tmp.<n>`. The parent directory is
    /// created; the file itself is not.
    std::filesystem::path create(const std::string& prefix);

    /// Removes every prefix directory this factory created files in.
    void cleanup();

    const std::filesystem::path& root() const {
        return root_;
    }

    /// Number of paths handed out so far.
    size_t created_count() const;

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    uint64_t counter_ = 0;
    size_t created_ = 0;
    std::vector<std::filesystem::path> prefix_dirs_;
};

} // namespace strata::rep
