#pragma once

#include "chunkgate/core/error.hpp"
#include "chunkgate/core/result.hpp"

#include <cstdint>

namespace chunkgate::transfer {

/**
 * @brief Half-open byte window [left, right) over a source of known length
 *
 * Invariants: 0 <= left <= right <= total_length and
 * right - left <= chunk_size. left == right only when the source is
 * exhausted (or empty).
 */
class TransferWindow {
public:
    TransferWindow(std::uint64_t total_length, std::uint64_t chunk_size);

    [[nodiscard]] std::uint64_t left() const noexcept { return left_; }
    [[nodiscard]] std::uint64_t right() const noexcept { return right_; }
    [[nodiscard]] std::uint64_t total_length() const noexcept { return total_length_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    [[nodiscard]] bool has_next() const noexcept { return left_ != right_; }
    [[nodiscard]] std::uint64_t current_length() const noexcept { return right_ - left_; }

    /// Zero-based index of the chunk currently in the window.
    [[nodiscard]] std::uint64_t chunk_index() const noexcept;

    /// Number of chunks the whole source splits into.
    [[nodiscard]] std::uint64_t chunk_count() const noexcept;

    /**
     * Moves the window to the next chunk. Fails with EndOfData, leaving the
     * window untouched, when there is nothing to acknowledge.
     */
    Result<void, TransferError> advance();

private:
    std::uint64_t left_ = 0;
    std::uint64_t right_ = 0;
    std::uint64_t total_length_ = 0;
    std::uint64_t chunk_size_ = 0;
};

} // namespace chunkgate::transfer
