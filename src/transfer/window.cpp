#include "chunkgate/transfer/window.hpp"

#include <algorithm>

namespace chunkgate::transfer {

TransferWindow::TransferWindow(std::uint64_t total_length, std::uint64_t chunk_size)
    : left_(0),
      right_(std::min(chunk_size, total_length)),
      total_length_(total_length),
      chunk_size_(chunk_size) {}

std::uint64_t TransferWindow::chunk_index() const noexcept {
    return chunk_size_ == 0 ? 0 : left_ / chunk_size_;
}

std::uint64_t TransferWindow::chunk_count() const noexcept {
    if (chunk_size_ == 0) {
        return 0;
    }
    return total_length_ / chunk_size_ + (total_length_ % chunk_size_ != 0 ? 1 : 0);
}

Result<void, TransferError> TransferWindow::advance() {
    if (left_ == right_) {
        return Err<void>(TransferError::EndOfData);
    }
    left_ = right_;
    right_ += std::min(chunk_size_, total_length_ - right_);
    return Ok<TransferError>();
}

} // namespace chunkgate::transfer
