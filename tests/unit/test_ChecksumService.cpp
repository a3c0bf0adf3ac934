#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "core/types/ChecksumResult.hpp"
#include "infrastructure/fileops/ChecksumService.hpp"

#include <stdexcept>

using namespace migengine::core;
using namespace migengine::infra;
using migengine::test::TempDirectory;
using migengine::test::writeFile;

namespace {

constexpr const char* kHelloMd5 = "5eb63bbbe01eeed093cb22bb8f5acdc3";
constexpr const char* kHelloSha1 = "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed";
constexpr const char* kHelloSha256 =
    "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

} // namespace

TEST_CASE("HashAlgorithm names", "[ChecksumService]") {
    SECTION("Round trips through strings") {
        REQUIRE(hashAlgorithmFromString("md5") == HashAlgorithm::MD5);
        REQUIRE(hashAlgorithmFromString("SHA-1") == HashAlgorithm::SHA1);
        REQUIRE(hashAlgorithmFromString("sha_256") == HashAlgorithm::SHA256);
        REQUIRE(hashAlgorithmToString(HashAlgorithm::SHA256) == "sha256");
    }

    SECTION("Rejects unknown algorithms") {
        REQUIRE_THROWS_AS(hashAlgorithmFromString("crc32"), std::invalid_argument);
    }

    SECTION("Digest lengths") {
        REQUIRE(hexDigestLength(HashAlgorithm::MD5) == 32);
        REQUIRE(hexDigestLength(HashAlgorithm::SHA1) == 40);
        REQUIRE(hexDigestLength(HashAlgorithm::SHA256) == 64);
    }
}

TEST_CASE("ChecksumService hashes files", "[ChecksumService]") {
    TempDirectory dir;
    ChecksumService service(16); // small buffer forces several reads

    SECTION("Known digests of a small file") {
        writeFile(dir / "hello.txt", "hello world");

        auto result = service.hashFile((dir / "hello.txt").string());
        REQUIRE(result.ok());
        REQUIRE(result.size == 11);
        REQUIRE(result.md5 == kHelloMd5);
        REQUIRE(result.sha1 == kHelloSha1);
        REQUIRE(result.sha256 == kHelloSha256);
        REQUIRE(result.digest(HashAlgorithm::SHA1) == kHelloSha1);
    }

    SECTION("Empty file") {
        writeFile(dir / "empty", "");

        auto result = service.hashFile((dir / "empty").string());
        REQUIRE(result.ok());
        REQUIRE(result.size == 0);
        REQUIRE(result.md5 == "d41d8cd98f00b204e9800998ecf8427e");
        REQUIRE(result.sha1 == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
        REQUIRE(result.sha256 ==
                "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("Hashing is idempotent") {
        writeFile(dir / "data.bin", migengine::test::randomBytes(100 * 1024));

        auto first = service.hashFile((dir / "data.bin").string());
        auto second = service.hashFile((dir / "data.bin").string());
        REQUIRE(first == second);
    }
}

TEST_CASE("ChecksumService batches", "[ChecksumService]") {
    TempDirectory dir;
    ChecksumService service;

    writeFile(dir / "a.txt", "hello world");
    writeFile(dir / "b.txt", "second file");

    SECTION("Results keep input order") {
        std::vector<std::string> files{(dir / "b.txt").string(), (dir / "a.txt").string()};

        auto batch = service.calculateChecksums(files, 2);
        REQUIRE(batch.success);
        REQUIRE(batch.results.size() == 2);
        REQUIRE(batch.results[0].file == files[0]);
        REQUIRE(batch.results[1].file == files[1]);
        REQUIRE(batch.results[1].sha256 == kHelloSha256);
    }

    SECTION("A missing file is reported in its own slot") {
        std::vector<std::string> files{(dir / "a.txt").string(), (dir / "missing.txt").string()};

        auto batch = service.calculateChecksums(files);
        REQUIRE(batch.success);
        REQUIRE(batch.failureCount() == 1);
        REQUIRE(batch.results[0].ok());
        REQUIRE_FALSE(batch.results[1].ok());
        REQUIRE(batch.results[1].md5.empty());
        REQUIRE(batch.results[1].sha256.empty());
    }

    SECTION("Empty input") {
        auto batch = service.calculateChecksums({});
        REQUIRE(batch.success);
        REQUIRE(batch.results.empty());
    }

    SECTION("Directory walk is sorted and recursive") {
        writeFile(dir / "nested" / "c.txt", "third");

        auto batch = service.calculateDirectoryChecksum(dir.path(), 0);
        REQUIRE(batch.results.size() == 3);
        REQUIRE(batch.results[0].file == (dir / "a.txt").string());
        REQUIRE(batch.results[1].file == (dir / "b.txt").string());
        REQUIRE(batch.results[2].file == (dir.path() / "nested" / "c.txt").string());
    }

    SECTION("Missing directory throws") {
        REQUIRE_THROWS_AS(service.calculateDirectoryChecksum(dir / "nope"), std::runtime_error);
    }
}

TEST_CASE("ChecksumService verifies digests", "[ChecksumService]") {
    TempDirectory dir;
    ChecksumService service;
    writeFile(dir / "hello.txt", "hello world");
    auto file = dir / "hello.txt";

    SECTION("Matching digest, case insensitive") {
        REQUIRE(service.verifyChecksum(file, kHelloMd5, "md5"));
        REQUIRE(service.verifyChecksum(file, "2AAE6C35C94FCFB415DBE95F408B9CE91EE846ED", "sha1"));
        REQUIRE(service.verifyChecksum(file, kHelloSha256, "sha256"));
    }

    SECTION("Mismatching digest") {
        REQUIRE_FALSE(service.verifyChecksum(file, kHelloMd5, "sha256"));
        REQUIRE_FALSE(service.verifyChecksum(file, "00", "md5"));
    }

    SECTION("Unsupported algorithm") {
        REQUIRE_THROWS_AS(service.verifyChecksum(file, kHelloMd5, "sha512"), std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS(service.verifyChecksum(dir / "missing", kHelloMd5, "md5"));
    }
}
