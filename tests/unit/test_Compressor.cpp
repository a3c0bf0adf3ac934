#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "infrastructure/fileops/Compressor.hpp"

#include <stdexcept>

using namespace migengine::core;
using namespace migengine::infra;
using migengine::test::readFile;
using migengine::test::TempDirectory;
using migengine::test::writeFile;

namespace {

std::string repetitiveText(size_t lines) {
    std::string text;
    for (size_t i = 0; i < lines; ++i) {
        text += "line " + std::to_string(i % 10) + " of a highly repetitive log file\n";
    }
    return text;
}

} // namespace

TEST_CASE("Compressor single-file streams", "[Compressor]") {
    TempDirectory dir;
    Compressor compressor(Compressor::Options{.chunkSize = 4096});

    auto content = repetitiveText(5000);
    writeFile(dir / "input.log", content);

    SECTION("gzip round trip") {
        auto packed = compressor.compress(dir / "input.log", dir / "input.log.gz");
        REQUIRE(packed.success);
        REQUIRE(packed.method == CompressionMethod::Gzip);
        REQUIRE(packed.originalSize == static_cast<int64_t>(content.size()));
        REQUIRE(packed.compressedSize < packed.originalSize);
        REQUIRE(packed.compressionRatio < 1.0);
        REQUIRE(packed.fileCount == 1);

        // gzip magic
        auto raw = readFile(dir / "input.log.gz");
        REQUIRE(static_cast<unsigned char>(raw[0]) == 0x1f);
        REQUIRE(static_cast<unsigned char>(raw[1]) == 0x8b);

        auto unpacked = compressor.decompress(dir / "input.log.gz", dir / "output.log");
        REQUIRE(unpacked.success);
        REQUIRE(unpacked.originalSize == packed.originalSize);
        REQUIRE(readFile(dir / "output.log") == content);
    }

    SECTION("zstd round trip") {
        auto packed =
            compressor.compress(dir / "input.log", dir / "packed.bin", CompressionMethod::Zstd);
        REQUIRE(packed.success);
        REQUIRE(packed.method == CompressionMethod::Zstd);
        REQUIRE(packed.compressedSize < packed.originalSize);

        auto unpacked =
            compressor.decompress(dir / "packed.bin", dir / "output.log", CompressionMethod::Zstd);
        REQUIRE(unpacked.success);
        REQUIRE(readFile(dir / "output.log") == content);
    }

    SECTION("Empty file") {
        writeFile(dir / "empty", "");
        auto packed = compressor.compress(dir / "empty", dir / "empty.zst");
        REQUIRE(packed.success);
        REQUIRE(packed.originalSize == 0);
        REQUIRE(packed.compressionRatio == 0.0);

        compressor.decompress(dir / "empty.zst", dir / "empty.out");
        REQUIRE(readFile(dir / "empty.out").empty());
    }

    SECTION("Incompressible data does not shrink meaningfully") {
        writeFile(dir / "random.bin", migengine::test::randomBytes(256 * 1024));
        auto packed = compressor.compress(dir / "random.bin", dir / "random.bin.gz");
        REQUIRE(packed.success);
        REQUIRE(packed.compressionRatio > 0.98);
    }

    SECTION("Small random input may expand but the ratio stays positive") {
        writeFile(dir / "small.bin", migengine::test::randomBytes(4000, 7));
        auto packed = compressor.compress(dir / "small.bin", dir / "small.bin.zst");
        REQUIRE(packed.success);
        REQUIRE(packed.compressionRatio > 0.0);
        REQUIRE(packed.compressedSize > 0);
    }

    SECTION("Truncated gzip stream is an error") {
        compressor.compress(dir / "input.log", dir / "input.log.gz");
        auto raw = readFile(dir / "input.log.gz");
        writeFile(dir / "cut.gz", raw.substr(0, raw.size() / 2));

        REQUIRE_THROWS_AS(compressor.decompress(dir / "cut.gz", dir / "cut.out"),
                          std::runtime_error);
    }

    SECTION("Truncated zstd stream is an error") {
        compressor.compress(dir / "input.log", dir / "input.log.zst");
        auto raw = readFile(dir / "input.log.zst");
        writeFile(dir / "cut.zst", raw.substr(0, raw.size() / 2));

        REQUIRE_THROWS_AS(compressor.decompress(dir / "cut.zst", dir / "cut.out"),
                          std::runtime_error);
    }

    SECTION("Unknown extension without explicit method") {
        REQUIRE_THROWS_AS(compressor.compress(dir / "input.log", dir / "input.rar"),
                          std::invalid_argument);
    }

    SECTION("Missing source") {
        REQUIRE_THROWS_AS(compressor.compress(dir / "missing", dir / "missing.gz"),
                          std::runtime_error);
    }
}

TEST_CASE("Compressor directory archives", "[Compressor]") {
    TempDirectory dir;
    Compressor compressor;

    auto tree = dir.path() / "tree";
    writeFile(tree / "readme.txt", repetitiveText(100));
    writeFile(tree / "bin" / "run.sh", "#!/bin/sh\necho ok\n");
    writeFile(tree / "data" / "blob.bin", migengine::test::randomBytes(10000));
    std::filesystem::permissions(tree / "bin" / "run.sh", std::filesystem::perms(0755),
                                 std::filesystem::perm_options::replace);
    std::filesystem::permissions(tree / "readme.txt", std::filesystem::perms(0600),
                                 std::filesystem::perm_options::replace);

    auto roundTrip = [&](const std::string& archiveName) {
        auto packed = compressor.compress(tree, dir / archiveName);
        REQUIRE(packed.success);
        REQUIRE(packed.fileCount == 3);

        auto restored = dir.path() / ("restored_" + archiveName);
        auto unpacked = compressor.decompress(dir / archiveName, restored);
        REQUIRE(unpacked.success);
        REQUIRE(unpacked.fileCount == 3);
        REQUIRE(unpacked.originalSize == packed.originalSize);

        REQUIRE(readFile(restored / "readme.txt") == readFile(tree / "readme.txt"));
        REQUIRE(readFile(restored / "bin" / "run.sh") == readFile(tree / "bin" / "run.sh"));
        REQUIRE(readFile(restored / "data" / "blob.bin") == readFile(tree / "data" / "blob.bin"));

        auto mode = [](const std::filesystem::path& p) {
            return std::filesystem::status(p).permissions() & std::filesystem::perms::mask;
        };
        REQUIRE(mode(restored / "bin" / "run.sh") == std::filesystem::perms(0755));
        REQUIRE(mode(restored / "readme.txt") == std::filesystem::perms(0600));
    };

    SECTION("tar") {
        roundTrip("tree.tar");
    }

    SECTION("tar.gz") {
        roundTrip("tree.tar.gz");
    }

    SECTION("tar.zst") {
        roundTrip("tree.tar.zst");
    }

    SECTION("Stream methods reject directories") {
        REQUIRE_THROWS_AS(compressor.compress(tree, dir / "tree.gz"), std::invalid_argument);
        REQUIRE_THROWS_AS(compressor.compress(tree, dir / "tree.zst"), std::invalid_argument);
    }

    SECTION("Archive of a single file") {
        auto packed = compressor.compress(tree / "readme.txt", dir / "single.tar.gz");
        REQUIRE(packed.fileCount == 1);

        compressor.decompress(dir / "single.tar.gz", dir / "single");
        REQUIRE(readFile(dir.path() / "single" / "readme.txt") == readFile(tree / "readme.txt"));
    }
}
