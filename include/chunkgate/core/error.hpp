#pragma once

#include <ostream>
#include <string_view>

namespace chunkgate {

/**
 * @brief Failure kinds reported by the transfer store
 *
 * NoSuchSource      - the key was never registered or has been discarded
 * EndOfData         - the window is terminal, nothing left to read or acknowledge
 * SourceReadFailure - the byte source could not produce the requested range
 */
enum class TransferError {
    NoSuchSource,
    EndOfData,
    SourceReadFailure
};

constexpr std::string_view to_string(TransferError error) noexcept {
    switch (error) {
        case TransferError::NoSuchSource: return "no-such-source";
        case TransferError::EndOfData: return "end-of-data";
        case TransferError::SourceReadFailure: return "source-read-failure";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, TransferError error) {
    return os << to_string(error);
}

} // namespace chunkgate
