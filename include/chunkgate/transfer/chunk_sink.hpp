#pragma once

#include "chunkgate/core/result.hpp"
#include "chunkgate/transfer/types.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

namespace chunkgate::transfer {

/**
 * @brief Sequential write session opened once per transfer
 *
 * close() must be safe to call more than once; only the first call does
 * any work.
 */
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    virtual Result<void> write(const Bytes& chunk) = 0;
    virtual Result<void> close() = 0;
};

/**
 * @brief Opens a sink for a transfer, given a suggested name
 */
using ChunkSinkFactory =
    std::function<Result<std::unique_ptr<ChunkSink>>(const std::string& suggested_name)>;

/**
 * @brief ChunkSink appending to a file, truncated when opened
 */
class FileChunkSink final : public ChunkSink {
public:
    static Result<std::unique_ptr<ChunkSink>> open(const std::filesystem::path& path);

    ~FileChunkSink() override;

    Result<void> write(const Bytes& chunk) override;
    Result<void> close() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileChunkSink(std::filesystem::path path, std::ofstream output);

    std::filesystem::path path_;
    std::ofstream output_;
    bool closed_ = false;
};

/**
 * @brief Factory writing each transfer to output_dir / suggested_name
 *
 * The directory is created on first use.
 */
ChunkSinkFactory make_file_sink_factory(std::filesystem::path output_dir);

} // namespace chunkgate::transfer
