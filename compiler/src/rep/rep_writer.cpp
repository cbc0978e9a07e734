#include "rep/rep_writer.hpp"

#include "log/log.hpp"
#include "rep/item_rep.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace strata::rep {

const char* write_action_name(WriteAction action) {
    switch (action) {
    case WriteAction::Created:
        return "create";
    case WriteAction::Updated:
        return "update";
    case WriteAction::Identical:
        return "identical";
    case WriteAction::Skipped:
        return "skip";
    }
    return "unknown";
}

// ============================================================================
// File Comparison
// ============================================================================

bool files_identical(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    auto size_a = fs::file_size(a, ec);
    if (ec) {
        return false;
    }
    auto size_b = fs::file_size(b, ec);
    if (ec || size_a != size_b) {
        return false;
    }

    std::ifstream in_a(a, std::ios::binary);
    std::ifstream in_b(b, std::ios::binary);
    if (!in_a || !in_b) {
        return false;
    }

    std::array<char, 64 * 1024> buf_a{};
    std::array<char, 64 * 1024> buf_b{};
    while (in_a && in_b) {
        in_a.read(buf_a.data(), buf_a.size());
        in_b.read(buf_b.data(), buf_b.size());
        auto count_a = in_a.gcount();
        if (count_a != in_b.gcount()) {
            return false;
        }
        if (!std::equal(buf_a.begin(), buf_a.begin() + count_a, buf_b.begin())) {
            return false;
        }
    }
    return in_a.eof() && in_b.eof();
}

bool file_has_content(const fs::path& path, const std::string& content) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec || size != content.size()) {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::string existing(content.size(), '\0');
    in.read(existing.data(), static_cast<std::streamsize>(existing.size()));
    return in.gcount() == static_cast<std::streamsize>(content.size()) && existing == content;
}

// ============================================================================
// RepWriter
// ============================================================================

auto RepWriter::write(const ItemRep& rep, const std::string& snapshot)
    -> Result<WriteResult, CompileError> {
    WriteResult result;

    auto raw = rep.raw_paths().find(snapshot);
    if (raw == rep.raw_paths().end()) {
        STRATA_LOG_TRACE("write", "No raw path for " << rep.describe() << " at " << snapshot);
        return result;
    }
    const fs::path& raw_path = raw->second;
    result.path = raw_path;

    event::Notification will_write{event::Event::WillWriteRep};
    will_write.rep = &rep;
    will_write.snapshot = snapshot;
    will_write.path = raw_path;
    notifications_.notify(will_write);

    std::error_code ec;
    result.is_created = !fs::exists(raw_path, ec);
    if (ec) {
        return CompileError::write_failed(rep.describe(), raw_path.string(),
                                          "cannot inspect existing file: " + ec.message());
    }

    const auto& store = rep.store();
    fs::path source_file;
    bool identical = false;
    if (const auto* binary = store.binary()) {
        const fs::path* file = binary->at(snapshot);
        source_file = file ? *file : binary->last();
        identical = !result.is_created && files_identical(source_file, raw_path);
    } else {
        identical = !result.is_created && file_has_content(raw_path, store.text()->last());
    }

    if (!identical) {
        if (raw_path.has_parent_path()) {
            fs::create_directories(raw_path.parent_path(), ec);
            if (ec) {
                return CompileError::write_failed(rep.describe(), raw_path.string(), ec.message());
            }
        }

        if (store.is_binary()) {
            fs::copy_file(source_file, raw_path, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return CompileError::write_failed(rep.describe(), raw_path.string(),
                                                  "cannot copy " + source_file.string() + ": " +
                                                      ec.message());
            }
        } else {
            const std::string& content = store.text()->last();
            std::ofstream out(raw_path, std::ios::binary | std::ios::trunc);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (!out) {
                return CompileError::write_failed(rep.describe(), raw_path.string(),
                                                  "cannot write file");
            }
        }
        result.is_modified = true;
    }

    if (result.is_created) {
        result.action = WriteAction::Created;
    } else if (result.is_modified) {
        result.action = WriteAction::Updated;
    } else {
        result.action = WriteAction::Identical;
    }
    STRATA_LOG_TRACE("write", write_action_name(result.action) << " " << raw_path.string());

    event::Notification written{event::Event::RepWritten};
    written.rep = &rep;
    written.snapshot = snapshot;
    written.path = raw_path;
    written.is_created = result.is_created;
    written.is_modified = result.is_modified;
    notifications_.notify(written);

    return result;
}

} // namespace strata::rep
