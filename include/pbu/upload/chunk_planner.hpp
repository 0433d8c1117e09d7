#pragma once

#include "pbu/core/result.hpp"
#include "pbu/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace pbu::upload {

/**
 * @brief Lazy chunk sequence covering [0, file_length)
 *
 * Chunks are computed on demand while iterating; nothing is read from disk.
 * Every chunk is chunk_size long except possibly the last, which carries
 * is_final. A zero-length file yields a single empty final chunk so the
 * session can still be opened and closed.
 *
 * The plan is a value: iterating it again restarts from offset 0 and yields
 * the same sequence.
 *
 * EXAMPLE:
 * ChunkPlan plan(25 * kMiB, 8 * kMiB);
 * for (const Chunk& chunk : plan) { ... }  // 8, 8, 8, 1 (final)
 */
class ChunkPlan {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        const_iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        const_iterator& operator++();
        const_iterator operator++(int) {
            const_iterator copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const const_iterator& other) const {
            return done_ == other.done_ && (done_ || current_.offset == other.current_.offset);
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class ChunkPlan;

        const_iterator(std::uint64_t file_length, std::uint64_t chunk_size, bool done);

        Chunk make_chunk(std::uint64_t offset) const;

        std::uint64_t file_length_ = 0;
        std::uint64_t chunk_size_ = 0;
        Chunk current_{};
        bool done_ = true;
    };

    /// chunk_size must be > 0; alignment is checked separately by validate_chunk_size().
    ChunkPlan(std::uint64_t file_length, std::uint64_t chunk_size);

    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

    [[nodiscard]] std::uint64_t file_length() const noexcept { return file_length_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    /// Number of chunks the plan yields (1 for an empty file).
    [[nodiscard]] std::size_t chunk_count() const noexcept;

    /// Materialize the whole plan.
    [[nodiscard]] std::vector<Chunk> to_vector() const;

private:
    std::uint64_t file_length_;
    std::uint64_t chunk_size_;
};

[[nodiscard]] bool is_aligned(std::uint64_t chunk_size) noexcept;

/**
 * @brief Check that chunk_size is usable for concurrent sessions
 *
 * RETURNS: PreconditionFailed unless chunk_size is a non-zero multiple of kChunkAlignment
 */
pbu::Result<void> validate_chunk_size(std::uint64_t chunk_size);

} // namespace pbu::upload
