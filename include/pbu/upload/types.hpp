#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pbu::upload {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

/// Appends into a concurrent session must be sized in multiples of this unit.
constexpr std::uint64_t kChunkAlignment = 4 * kMiB;

/// Store-imposed ceiling on the number of sessions committed by one finish call.
constexpr std::size_t kMaxBatchSize = 1000;

using SessionId = std::string;
using AsyncJobId = std::string;

enum class SessionType {
    Sequential,  ///< Appends must arrive in offset order
    Concurrent   ///< Appends name their offset and may arrive in any order
};

/**
 * @brief Position inside a remote upload session
 *
 * offset counts the bytes that precede the data sent with this cursor.
 */
struct Cursor {
    SessionId session_id;
    std::uint64_t offset = 0;
};

/**
 * @brief One contiguous byte range of a source file
 */
struct Chunk {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    bool is_final = false;

    bool operator==(const Chunk& other) const {
        return offset == other.offset && length == other.length && is_final == other.is_final;
    }
    bool operator!=(const Chunk& other) const { return !(*this == other); }
};

/**
 * @brief Local file handed to the uploader by the file collector
 */
struct SourceFile {
    std::filesystem::path path;
    std::uint64_t size = 0;
    std::string destination_name;  ///< File name placed under the remote folder
};

/**
 * @brief Closes and places one file; consumed exactly once by the batch finish call
 */
struct CommitDescriptor {
    Cursor cursor;            ///< cursor.offset == total file length
    std::string path;         ///< Destination path, e.g. "/Uploads/report.pdf"
};

/**
 * @brief Per-entry outcome as answered by the store
 */
struct EntryOutcome {
    enum class Kind {
        Success,
        Failure,
        Other
    };

    Kind kind = Kind::Other;
    std::string path_lower;       ///< Set for Success
    std::string failure_reason;   ///< Set for Failure
};

/**
 * @brief Answer to the batch finish call
 */
struct FinishLaunch {
    enum class Kind {
        Complete,
        AsyncJob,
        Other
    };

    Kind kind = Kind::Other;
    std::vector<EntryOutcome> entries;  ///< Set for Complete
    AsyncJobId async_job_id;            ///< Set for AsyncJob
};

/**
 * @brief Answer to polling an asynchronous finish job
 */
struct FinishJobStatus {
    bool in_progress = true;
    std::vector<EntryOutcome> entries;  ///< Set once !in_progress
};

/**
 * @brief Reconciled outcome of one file in a batch
 */
struct EntryResult {
    std::size_t index = 0;        ///< Position of the source file in the batch
    bool success = false;
    std::string commit_path;      ///< Path submitted with the commit descriptor
    std::string remote_path;      ///< Store-reported path (success only)
    std::string reason;           ///< Store-reported reason (failure only)
};

struct BatchReport {
    std::vector<EntryResult> entries;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::uint64_t bytes_uploaded = 0;
    std::chrono::milliseconds elapsed{0};
};

} // namespace pbu::upload
