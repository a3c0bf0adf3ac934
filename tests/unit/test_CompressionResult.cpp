#include <catch2/catch_test_macros.hpp>

#include "core/types/CompressionResult.hpp"

#include <stdexcept>

using namespace migengine::core;

TEST_CASE("CompressionMethod from path", "[CompressionResult]") {
    SECTION("Compound suffixes win over plain ones") {
        REQUIRE(compressionMethodFromPath("backup.tar.gz") == CompressionMethod::TarGzip);
        REQUIRE(compressionMethodFromPath("backup.tgz") == CompressionMethod::TarGzip);
        REQUIRE(compressionMethodFromPath("backup.tar.zst") == CompressionMethod::TarZstd);
        REQUIRE(compressionMethodFromPath("backup.tar") == CompressionMethod::Tar);
    }

    SECTION("Single-file streams") {
        REQUIRE(compressionMethodFromPath("/var/log/app.log.gz") == CompressionMethod::Gzip);
        REQUIRE(compressionMethodFromPath("dump.SQL.ZST") == CompressionMethod::Zstd);
    }

    SECTION("Unknown suffix") {
        REQUIRE_THROWS_AS(compressionMethodFromPath("archive.zip"), std::invalid_argument);
    }
}

TEST_CASE("CompressionMethod names", "[CompressionResult]") {
    REQUIRE(compressionMethodFromString("gzip") == CompressionMethod::Gzip);
    REQUIRE(compressionMethodFromString("ZSTD") == CompressionMethod::Zstd);
    REQUIRE(compressionMethodFromString("tar.gz") == CompressionMethod::TarGzip);
    REQUIRE(compressionMethodToString(CompressionMethod::TarZstd) == "tar.zst");
    REQUIRE_THROWS_AS(compressionMethodFromString("bzip2"), std::invalid_argument);

    REQUIRE(isArchiveMethod(CompressionMethod::Tar));
    REQUIRE_FALSE(isArchiveMethod(CompressionMethod::Gzip));
}

TEST_CASE("CompressionResult ratio", "[CompressionResult]") {
    REQUIRE(CompressionResult::ratio(50, 100) == 0.5);
    REQUIRE(CompressionResult::ratio(10, 0) == 0.0);

    CompressionResult result;
    result.duration = std::chrono::microseconds(2500);
    REQUIRE(result.durationMs() == 2.5);
}
