#include "chunkgate/transfer/byte_source.hpp"

#include <fstream>
#include <system_error>

namespace chunkgate::transfer {
namespace fs = std::filesystem;

Result<Bytes> FileByteSource::read(const std::string& source_id,
                                   std::uint64_t start,
                                   std::uint64_t end) {
    if (end < start) {
        return Err<Bytes>(std::string("Invalid range for ") + source_id);
    }

    std::ifstream input(source_id, std::ios::binary);
    if (!input) {
        return Err<Bytes>(std::string("Failed to open source file: ") + source_id);
    }

    input.seekg(static_cast<std::streamoff>(start));
    if (!input) {
        return Err<Bytes>(std::string("Failed to seek in source file: ") + source_id);
    }

    Bytes buffer(static_cast<std::size_t>(end - start));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto bytes_read = static_cast<std::size_t>(input.gcount());
    if (bytes_read != buffer.size()) {
        return Err<Bytes>(std::string("Short read from ") + source_id + ": got " +
                          std::to_string(bytes_read) + " of " + std::to_string(buffer.size()) + " bytes");
    }

    return Ok(std::move(buffer));
}

Result<SourceDescriptor> describe_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<SourceDescriptor>(std::string("Not a regular file: ") + path.string());
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<SourceDescriptor>(std::string("Failed to stat file: ") + path.string());
    }

    SourceDescriptor descriptor;
    descriptor.id = path.string();
    descriptor.name = path.filename().string();
    descriptor.total_length = static_cast<std::uint64_t>(size);
    return Ok(std::move(descriptor));
}

} // namespace chunkgate::transfer
