#include "chunkgate/transfer/chunk_sink.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace chunkgate::transfer {
namespace fs = std::filesystem;

Result<std::unique_ptr<ChunkSink>> FileChunkSink::open(const fs::path& path) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<std::unique_ptr<ChunkSink>>(std::string("Failed to open sink file: ") + path.string());
    }
    return Ok(std::unique_ptr<ChunkSink>(new FileChunkSink(path, std::move(output))));
}

FileChunkSink::FileChunkSink(fs::path path, std::ofstream output)
    : path_(std::move(path)),
      output_(std::move(output)) {}

FileChunkSink::~FileChunkSink() {
    if (!closed_) {
        auto result = close();
        if (result.is_error()) {
            spdlog::warn("Sink {} not closed cleanly: {}", path_.string(), result.error());
        }
    }
}

Result<void> FileChunkSink::write(const Bytes& chunk) {
    if (closed_) {
        return Err<void>(std::string("Write after close: ") + path_.string());
    }
    output_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!output_) {
        return Err<void>(std::string("Failed to write chunk to ") + path_.string());
    }
    return Ok();
}

Result<void> FileChunkSink::close() {
    if (closed_) {
        return Ok();
    }
    closed_ = true;
    output_.flush();
    const bool flushed = static_cast<bool>(output_);
    output_.close();
    if (!flushed || output_.fail()) {
        return Err<void>(std::string("Failed to close sink file: ") + path_.string());
    }
    return Ok();
}

ChunkSinkFactory make_file_sink_factory(fs::path output_dir) {
    return [output_dir = std::move(output_dir)](const std::string& suggested_name)
               -> Result<std::unique_ptr<ChunkSink>> {
        std::error_code ec;
        fs::create_directories(output_dir, ec);
        if (ec && !fs::exists(output_dir)) {
            return Err<std::unique_ptr<ChunkSink>>(std::string("Failed to create directory: ") + output_dir.string());
        }
        return FileChunkSink::open(output_dir / fs::path(suggested_name).filename());
    };
}

} // namespace chunkgate::transfer
