#include "pbu/upload/file_collector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <system_error>

namespace pbu::upload {
namespace fs = std::filesystem;

bool is_ignored_file(const std::string& file_name) {
    static const std::array<const char*, 3> ignored{".DS_Store", ".localized", ".gitignore"};
    return std::find(ignored.begin(), ignored.end(), file_name) != ignored.end();
}

pbu::Result<std::vector<SourceFile>> collect_files(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return pbu::Err<std::vector<SourceFile>>(ErrorCode::NotFound, "not a directory: " + folder.string());
    }

    std::vector<SourceFile> files;
    fs::directory_iterator it(folder, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;

        // Entries whose status cannot be read (dangling symlinks) are skipped
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (is_ignored_file(name)) {
            continue;
        }

        const auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            return pbu::Err<std::vector<SourceFile>>(ErrorCode::IoError,
                                                     "cannot stat " + entry.path().string() + ": " +
                                                         entry_ec.message());
        }
        files.push_back(SourceFile{entry.path(), static_cast<std::uint64_t>(size), name});
    }
    if (ec) {
        return pbu::Err<std::vector<SourceFile>>(ErrorCode::IoError,
                                                 "cannot list " + folder.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), [](const SourceFile& lhs, const SourceFile& rhs) {
        return lhs.path < rhs.path;
    });

    spdlog::info("Collected {} files for upload from '{}'", files.size(), folder.string());
    return pbu::Ok(std::move(files));
}

std::vector<std::vector<SourceFile>> split_into_batches(const std::vector<SourceFile>& files,
                                                        std::size_t batch_size) {
    std::vector<std::vector<SourceFile>> batches;
    if (batch_size == 0) {
        return batches;
    }
    for (std::size_t start = 0; start < files.size(); start += batch_size) {
        const auto stop = std::min(files.size(), start + batch_size);
        batches.emplace_back(files.begin() + static_cast<std::ptrdiff_t>(start),
                             files.begin() + static_cast<std::ptrdiff_t>(stop));
    }
    return batches;
}

} // namespace pbu::upload
