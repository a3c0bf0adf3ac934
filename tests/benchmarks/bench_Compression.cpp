#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "infrastructure/fileops/Compressor.hpp"

#include <string>

using namespace migengine::core;
using namespace migengine::infra;
using migengine::test::TempDirectory;
using migengine::test::writeFile;

namespace {

std::string logText(size_t bytes) {
    std::string text;
    text.reserve(bytes);
    for (size_t i = 0; text.size() < bytes; ++i) {
        text += "2024-01-01T00:00:" + std::to_string(i % 60) +
                " INFO request served path=/index.php status=200\n";
    }
    return text;
}

} // namespace

// =============================================================================
// Stream Compression Benchmarks
// =============================================================================

TEST_CASE("Stream compression benchmarks", "[benchmark][Compressor]") {
    TempDirectory dir("migengine_bench");
    writeFile(dir / "access.log", logText(4 * 1024 * 1024));

    Compressor compressor;

    BENCHMARK("gzip 4 MiB of log text") {
        return compressor.compress(dir / "access.log", dir / "access.log.gz");
    };

    BENCHMARK("zstd 4 MiB of log text") {
        return compressor.compress(dir / "access.log", dir / "access.log.zst");
    };

    compressor.compress(dir / "access.log", dir / "ref.gz");
    compressor.compress(dir / "access.log", dir / "ref.zst");

    BENCHMARK("gunzip 4 MiB") {
        return compressor.decompress(dir / "ref.gz", dir / "out.gz.log");
    };

    BENCHMARK("zstd decompress 4 MiB") {
        return compressor.decompress(dir / "ref.zst", dir / "out.zst.log");
    };
}

// =============================================================================
// Archive Benchmarks
// =============================================================================

TEST_CASE("Archive benchmarks", "[benchmark][Compressor]") {
    TempDirectory dir("migengine_bench");
    for (int i = 0; i < 100; ++i) {
        writeFile(dir.path() / "tree" / ("dir" + std::to_string(i % 10)) /
                      ("file" + std::to_string(i) + ".txt"),
                  logText(16 * 1024));
    }

    Compressor compressor;

    BENCHMARK("tar.gz of 100 files") {
        return compressor.compress(dir / "tree", dir / "tree.tar.gz");
    };

    BENCHMARK("tar.zst of 100 files") {
        return compressor.compress(dir / "tree", dir / "tree.tar.zst");
    };
}
