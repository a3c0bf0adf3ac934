#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "infrastructure/fileops/FileCopier.hpp"
#include "infrastructure/network/TransferService.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>

using namespace migengine::core;
using namespace migengine::infra;
using migengine::test::LocalHttpServer;
using migengine::test::readFile;
using migengine::test::TempDirectory;
using migengine::test::writeFile;

namespace {

TransferConfig fastRetryConfig(int retries) {
    TransferConfig config;
    config.chunkSize = 1024;
    config.maxConcurrency = 2;
    config.timeout = std::chrono::milliseconds(5000);
    config.retryAttempts = retries;
    config.retryDelay = std::chrono::milliseconds(10);
    return config;
}

} // namespace

TEST_CASE("TransferService HTTP download", "[TransferService]") {
    TempDirectory dir;
    FileCopier copier;

    SECTION("Succeeds after transient server errors") {
        std::atomic<int> calls{0};
        LocalHttpServer server([&calls](const httplib::Request&, httplib::Response& response) {
            if (++calls < 3) {
                LocalHttpServer::reply(response, 503, "try later");
                return;
            }
            LocalHttpServer::reply(response, 200, "final payload");
        });

        TransferService service(fastRetryConfig(3), copier);
        auto result = service.download(server.url("/payload.bin"), dir / "out" / "payload.bin");

        REQUIRE(result.success);
        REQUIRE(result.method == "http");
        REQUIRE(result.bytesTransferred == 13);
        REQUIRE(readFile(dir.path() / "out" / "payload.bin") == "final payload");
        REQUIRE(server.requestCount() == 3);
    }

    SECTION("Gives up when retries are exhausted") {
        LocalHttpServer server([](const httplib::Request&, httplib::Response& response) {
            LocalHttpServer::reply(response, 500, "");
        });

        TransferService service(fastRetryConfig(2), copier);
        auto result = service.download(server.url("/broken"), dir / "broken.bin");

        REQUIRE_FALSE(result.success);
        REQUIRE(result.error.find("500") != std::string::npos);
        REQUIRE(server.requestCount() == 3);
    }

    SECTION("Non-200 success codes count as failure for downloads") {
        LocalHttpServer server([](const httplib::Request&, httplib::Response& response) {
            LocalHttpServer::reply(response, 204, "");
        });

        TransferService service(fastRetryConfig(0), copier);
        auto result = service.download(server.url("/empty"), dir / "empty.bin");
        REQUIRE_FALSE(result.success);
    }

    SECTION("transfer() with http method downloads") {
        LocalHttpServer server([](const httplib::Request&, httplib::Response& response) {
            LocalHttpServer::reply(response, 200, "via transfer");
        });

        TransferService service(fastRetryConfig(0), copier);
        auto result = service.transfer(server.url("/x"), (dir / "x.bin").string(), "HTTP");
        REQUIRE(result.success);
        REQUIRE(readFile(dir / "x.bin") == "via transfer");
    }

    SECTION("Concurrent downloads keep input order and name files") {
        LocalHttpServer server([](const httplib::Request& request, httplib::Response& response) {
            LocalHttpServer::reply(response, 200, "body of " + request.path);
        });

        TransferService service(fastRetryConfig(0), copier);
        auto results = service.concurrentDownload(
            {server.url("/a.txt"), server.url("/"), "ftp://nowhere/file"}, dir / "downloads");

        REQUIRE(results.size() == 3);
        REQUIRE(results[0].success);
        REQUIRE(readFile(dir.path() / "downloads" / "a.txt") == "body of /a.txt");
        REQUIRE(results[1].success);
        REQUIRE(readFile(dir.path() / "downloads" / "download_1") == "body of /");
        REQUIRE_FALSE(results[2].success);
    }
}

TEST_CASE("TransferService HTTP upload", "[TransferService]") {
    TempDirectory dir;
    FileCopier copier;
    writeFile(dir / "report.csv", "a,b,c\n1,2,3\n");

    std::atomic<int> calls{0};
    LocalHttpServer server([&calls](const httplib::Request&, httplib::Response& response) {
        if (++calls == 1) {
            LocalHttpServer::reply(response, 502, "");
            return;
        }
        LocalHttpServer::reply(response, 201, "");
    });

    TransferService service(fastRetryConfig(1), copier);
    auto result = service.upload(dir / "report.csv", server.url("/upload/report.csv"));

    REQUIRE(result.success);
    REQUIRE(result.bytesTransferred == 12);
    REQUIRE(server.requestCount() == 2);
}

TEST_CASE("TransferService local methods", "[TransferService]") {
    TempDirectory dir;
    FileCopier copier;
    TransferService service(fastRetryConfig(0), copier);

    auto content = migengine::test::randomBytes(10 * 1024 + 3);
    writeFile(dir / "source.bin", content);

    SECTION("chunked") {
        auto result =
            service.transfer((dir / "source.bin").string(), (dir / "chunked.bin").string(), "chunked");
        REQUIRE(result.success);
        REQUIRE(result.method == "chunked");
        REQUIRE(result.bytesTransferred == static_cast<int64_t>(content.size()));
        REQUIRE(readFile(dir / "chunked.bin") == content);
    }

    SECTION("concurrent copies a directory") {
        writeFile(dir.path() / "tree" / "one", "1");
        writeFile(dir.path() / "tree" / "sub" / "two", "22");

        auto result = service.transfer((dir / "tree").string(), (dir / "copy").string(), "concurrent");
        REQUIRE(result.success);
        REQUIRE(result.bytesTransferred == 3);
        REQUIRE(readFile(dir.path() / "copy" / "sub" / "two") == "22");
    }

    SECTION("Missing source is a failed result") {
        auto result = service.transfer((dir / "missing").string(), (dir / "out").string(), "chunked");
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("Unsupported method throws") {
        REQUIRE_THROWS_AS(service.transfer("a", "b", "rsync"), std::invalid_argument);
    }

    SECTION("Progress callback is monotonic and ends at the total") {
        std::vector<int64_t> seen;
        int64_t reportedTotal = 0;
        auto result = service.transferWithProgress(
            dir / "source.bin", dir / "progress.bin", [&](int64_t transferred, int64_t total) {
                seen.push_back(transferred);
                reportedTotal = total;
            });

        REQUIRE(result.success);
        REQUIRE(seen.size() == 11);
        REQUIRE(std::is_sorted(seen.begin(), seen.end()));
        REQUIRE(seen.back() == static_cast<int64_t>(content.size()));
        REQUIRE(reportedTotal == static_cast<int64_t>(content.size()));
    }
}
