#pragma once

#include "pbu/core/result.hpp"
#include "pbu/upload/types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace pbu::upload {

/**
 * @brief Regular files directly inside `folder`, sorted by path
 *
 * Sub-directories and desktop clutter (.DS_Store, .localized, .gitignore)
 * are skipped. destination_name is the plain file name.
 */
pbu::Result<std::vector<SourceFile>> collect_files(const std::filesystem::path& folder);

bool is_ignored_file(const std::string& file_name);

/// Split files into consecutive batches of at most batch_size entries.
std::vector<std::vector<SourceFile>> split_into_batches(const std::vector<SourceFile>& files,
                                                        std::size_t batch_size = kMaxBatchSize);

} // namespace pbu::upload
