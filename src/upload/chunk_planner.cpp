#include "pbu/upload/chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace pbu::upload {

ChunkPlan::const_iterator::const_iterator(std::uint64_t file_length, std::uint64_t chunk_size, bool done)
    : file_length_(file_length), chunk_size_(chunk_size), done_(done) {
    if (!done_) {
        current_ = make_chunk(0);
    }
}

Chunk ChunkPlan::const_iterator::make_chunk(std::uint64_t offset) const {
    const auto remaining = file_length_ - offset;
    const auto length = std::min<std::uint64_t>(remaining, chunk_size_);
    return Chunk{offset, length, offset + length == file_length_};
}

ChunkPlan::const_iterator& ChunkPlan::const_iterator::operator++() {
    if (done_) {
        return *this;
    }
    if (current_.is_final) {
        done_ = true;
        current_ = Chunk{};
        return *this;
    }
    current_ = make_chunk(current_.offset + current_.length);
    return *this;
}

ChunkPlan::ChunkPlan(std::uint64_t file_length, std::uint64_t chunk_size)
    : file_length_(file_length), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

ChunkPlan::const_iterator ChunkPlan::begin() const {
    return const_iterator(file_length_, chunk_size_, false);
}

ChunkPlan::const_iterator ChunkPlan::end() const {
    return const_iterator(file_length_, chunk_size_, true);
}

std::size_t ChunkPlan::chunk_count() const noexcept {
    if (file_length_ == 0) {
        return 1;
    }
    return static_cast<std::size_t>((file_length_ + chunk_size_ - 1) / chunk_size_);
}

std::vector<Chunk> ChunkPlan::to_vector() const {
    std::vector<Chunk> chunks;
    chunks.reserve(chunk_count());
    for (const auto& chunk : *this) {
        chunks.push_back(chunk);
    }
    return chunks;
}

bool is_aligned(std::uint64_t chunk_size) noexcept {
    return chunk_size > 0 && chunk_size % kChunkAlignment == 0;
}

pbu::Result<void> validate_chunk_size(std::uint64_t chunk_size) {
    if (!is_aligned(chunk_size)) {
        return pbu::Err<void>(ErrorCode::PreconditionFailed,
                              "chunk size " + std::to_string(chunk_size) +
                              " must be a non-zero multiple of " + std::to_string(kChunkAlignment) +
                              " bytes to use concurrent upload sessions");
    }
    return pbu::Ok();
}

} // namespace pbu::upload
