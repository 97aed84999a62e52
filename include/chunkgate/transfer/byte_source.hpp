#pragma once

#include "chunkgate/core/result.hpp"
#include "chunkgate/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkgate::transfer {

/**
 * @brief Random-access reader of byte ranges out of a source
 *
 * Implementations return exactly end - start bytes or an error. A short
 * read is an error, never a silently truncated buffer.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual Result<Bytes> read(const std::string& source_id,
                               std::uint64_t start,
                               std::uint64_t end) = 0;
};

/**
 * @brief ByteSource over local files; source_id is the file path
 *
 * Each read opens the file, so a single instance serves any number of
 * concurrent transfers.
 */
class FileByteSource final : public ByteSource {
public:
    Result<Bytes> read(const std::string& source_id,
                       std::uint64_t start,
                       std::uint64_t end) override;
};

/**
 * @brief Builds a SourceDescriptor for a regular file
 *
 * name is the file name without directories, total_length the size on disk.
 */
Result<SourceDescriptor> describe_file(const std::filesystem::path& path);

} // namespace chunkgate::transfer
