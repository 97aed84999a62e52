#include "chunkgate/transfer/byte_source.hpp"
#include "chunkgate/transfer/chunk_sink.hpp"
#include "chunkgate/transfer/driver.hpp"
#include "chunkgate/transfer/store.hpp"
#include "chunkgate/events/event_bus.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using chunkgate::events::EventBus;
using chunkgate::transfer::Bytes;
using chunkgate::transfer::FileByteSource;
using chunkgate::transfer::FileChunkSink;
using chunkgate::transfer::TransferDriver;
using chunkgate::transfer::TransferOutcome;
using chunkgate::transfer::TransferStore;
using chunkgate::transfer::describe_file;
using chunkgate::transfer::make_file_sink_factory;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkgate_file_io_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string write_file(const fs::path& path, std::size_t length) {
    std::string content;
    content.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        content.push_back(static_cast<char>('a' + (i % 26)));
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

TEST(FileByteSourceTest, ReadsRequestedRange) {
    const auto dir = create_temp_dir();
    const auto file = dir / "source.txt";
    const auto content = write_file(file, 100);

    FileByteSource source;
    auto bytes = source.read(file.string(), 10, 20);
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(std::string(bytes.value().begin(), bytes.value().end()), content.substr(10, 10));
}

TEST(FileByteSourceTest, RangePastEndIsAnError) {
    const auto dir = create_temp_dir();
    const auto file = dir / "short.txt";
    write_file(file, 10);

    FileByteSource source;
    EXPECT_TRUE(source.read(file.string(), 5, 15).is_error());
}

TEST(FileByteSourceTest, MissingFileIsAnError) {
    FileByteSource source;
    EXPECT_TRUE(source.read("/nonexistent/chunkgate/file", 0, 1).is_error());
}

TEST(DescribeFileTest, UsesFileNameAndSize) {
    const auto dir = create_temp_dir();
    const auto file = dir / "report.pdf";
    write_file(file, 1234);

    auto descriptor = describe_file(file);
    ASSERT_TRUE(descriptor.is_ok());
    EXPECT_EQ(descriptor.value().name, "report.pdf");
    EXPECT_EQ(descriptor.value().id, file.string());
    EXPECT_EQ(descriptor.value().total_length, 1234u);
}

TEST(DescribeFileTest, RejectsDirectories) {
    const auto dir = create_temp_dir();
    EXPECT_TRUE(describe_file(dir).is_error());
    EXPECT_TRUE(describe_file(dir / "missing").is_error());
}

TEST(FileChunkSinkTest, WritesSequentiallyAndClosesOnce) {
    const auto dir = create_temp_dir();
    const auto path = dir / "out.bin";

    auto opened = FileChunkSink::open(path);
    ASSERT_TRUE(opened.is_ok());
    auto& sink = *opened.value();

    ASSERT_TRUE(sink.write(Bytes{'a', 'b'}).is_ok());
    ASSERT_TRUE(sink.write(Bytes{'c'}).is_ok());
    ASSERT_TRUE(sink.close().is_ok());
    EXPECT_TRUE(sink.close().is_ok());
    EXPECT_TRUE(sink.write(Bytes{'d'}).is_error());

    EXPECT_EQ(read_file(path), "abc");
}

TEST(FileChunkSinkTest, FactoryCreatesOutputDirectory) {
    const auto dir = create_temp_dir() / "nested" / "out";
    auto factory = make_file_sink_factory(dir);

    auto opened = factory("result.bin");
    ASSERT_TRUE(opened.is_ok());
    ASSERT_TRUE(opened.value()->write(Bytes{'x'}).is_ok());
    ASSERT_TRUE(opened.value()->close().is_ok());

    EXPECT_EQ(read_file(dir / "result.bin"), "x");
}

TEST(FileTransferTest, CopiesFileThroughStoreAndDriver) {
    const auto source_dir = create_temp_dir();
    const auto output_dir = create_temp_dir();
    const auto file = source_dir / "payload.bin";
    const auto content = write_file(file, 100000);

    EventBus bus;
    TransferStore store(16384, std::make_shared<FileByteSource>(), bus);
    TransferDriver driver(store, bus, make_file_sink_factory(output_dir));

    auto descriptor = describe_file(file);
    ASSERT_TRUE(descriptor.is_ok());
    const auto key = store.register_source(descriptor.value());
    driver.wait_idle();

    auto reports = driver.reports();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, TransferOutcome::Completed);
    EXPECT_EQ(reports[0].chunks_delivered, 7u);
    EXPECT_EQ(read_file(output_dir / key), content);
}
