#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "infrastructure/fileops/ChecksumService.hpp"
#include "infrastructure/fileops/FileCopier.hpp"
#include "infrastructure/fileops/MultiDigest.hpp"

#include <string>
#include <vector>

using namespace migengine::core;
using namespace migengine::infra;
using migengine::test::TempDirectory;
using migengine::test::writeFile;

// =============================================================================
// Digest Benchmarks
// =============================================================================

TEST_CASE("Digest benchmarks", "[benchmark][ChecksumService]") {
    auto block = migengine::test::randomBytes(1024 * 1024);

    BENCHMARK("SHA-256 of 1 MiB") {
        Digest digest(HashAlgorithm::SHA256);
        digest.update(block.data(), block.size());
        return digest.finalHex();
    };

    BENCHMARK("MD5 + SHA-1 + SHA-256 of 1 MiB in one pass") {
        MultiDigest digest({HashAlgorithm::MD5, HashAlgorithm::SHA1, HashAlgorithm::SHA256});
        digest.update(block.data(), block.size());
        return digest.finalHex();
    };
}

// =============================================================================
// File Hashing Benchmarks
// =============================================================================

TEST_CASE("File hashing benchmarks", "[benchmark][ChecksumService]") {
    TempDirectory dir("migengine_bench");
    std::vector<std::string> files;
    for (int i = 0; i < 16; ++i) {
        auto path = dir / ("file" + std::to_string(i) + ".bin");
        writeFile(path, migengine::test::randomBytes(512 * 1024, static_cast<uint32_t>(i)));
        files.push_back(path.string());
    }

    ChecksumService service;

    BENCHMARK("16 x 512 KiB, sequential") {
        return service.calculateChecksums(files, 1);
    };

    BENCHMARK("16 x 512 KiB, concurrency 4") {
        return service.calculateChecksums(files, 4);
    };

    BENCHMARK("16 x 512 KiB, unbounded") {
        return service.calculateChecksums(files, 0);
    };

    FileCopier copier;
    BENCHMARK("Copy 512 KiB with SHA-256") {
        return copier.copyFile(files[0], dir / "copy.bin");
    };
}
