#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "app/Application.hpp"

using namespace migengine::app;
using migengine::test::TempDirectory;
using migengine::test::writeFile;

namespace {

CommandLineOptions baseOptions(const TempDirectory& configDir, const std::string& operation) {
    CommandLineOptions options;
    options.operation = operation;
    options.configDir = configDir.path();
    options.logLevel = "off";
    return options;
}

} // namespace

TEST_CASE("Application envelopes", "[integration][Application]") {
    TempDirectory configDir;
    TempDirectory work;

    SECTION("version") {
        Application app(baseOptions(configDir, "version"));
        auto envelope = app.execute();

        REQUIRE(envelope["success"] == true);
        REQUIRE(envelope["data"]["name"] == "migration-engine");
        REQUIRE_FALSE(envelope.contains("error"));
        REQUIRE_FALSE(envelope.contains("metrics"));
        REQUIRE(std::filesystem::exists(configDir.path() / "config.json"));
    }

    SECTION("Unknown operation is an error envelope") {
        Application app(baseOptions(configDir, "teleport"));
        auto envelope = app.execute();

        REQUIRE(envelope["success"] == false);
        REQUIRE(envelope["error"] == "unknown operation: teleport");
        REQUIRE_FALSE(envelope.contains("data"));
    }

    SECTION("Missing required option") {
        Application app(baseOptions(configDir, "copy"));
        auto envelope = app.execute();

        REQUIRE(envelope["success"] == false);
        REQUIRE(envelope["error"].get<std::string>().find("--source") != std::string::npos);
    }

    SECTION("checksum with per-file error still succeeds") {
        writeFile(work / "a.txt", "hello world");

        auto options = baseOptions(configDir, "checksum");
        options.files = {(work / "a.txt").string(), (work / "missing.txt").string()};
        options.includeMetrics = true;

        Application app(std::move(options));
        auto envelope = app.execute();

        REQUIRE(envelope["success"] == true);
        const auto& results = envelope["data"]["results"];
        REQUIRE(results.size() == 2);
        REQUIRE(results[0]["md5"] == "5eb63bbbe01eeed093cb22bb8f5acdc3");
        REQUIRE(results[1].contains("error"));
        REQUIRE(envelope["metrics"]["total_operation_count"] == 1);
    }

    SECTION("verify") {
        writeFile(work / "a.txt", "hello world");

        auto options = baseOptions(configDir, "verify");
        options.file = (work / "a.txt").string();
        options.expected = "5eb63bbbe01eeed093cb22bb8f5acdc3";
        options.algorithm = "md5";

        Application app(std::move(options));
        auto envelope = app.execute();
        REQUIRE(envelope["data"]["valid"] == true);
    }

    SECTION("copy then compress") {
        writeFile(work.path() / "tree" / "one.txt", "one");
        writeFile(work.path() / "tree" / "sub" / "two.txt", "two");

        auto copy = baseOptions(configDir, "copy");
        copy.source = (work / "tree").string();
        copy.destination = (work / "copy").string();
        {
            Application app(std::move(copy));
            auto envelope = app.execute();
            REQUIRE(envelope["success"] == true);
            REQUIRE(envelope["data"]["bytes_copied"] == 6);
        }

        auto compress = baseOptions(configDir, "compress");
        compress.source = (work / "copy").string();
        compress.destination = (work / "copy.tar.gz").string();
        {
            Application app(std::move(compress));
            auto envelope = app.execute();
            REQUIRE(envelope["success"] == true);
            REQUIRE(envelope["data"]["method"] == "tar.gz");
            REQUIRE(envelope["data"]["file_count"] == 2);
        }
    }

    SECTION("Unsupported compression method") {
        writeFile(work / "a.txt", "data");
        auto options = baseOptions(configDir, "compress");
        options.source = (work / "a.txt").string();
        options.destination = (work / "a.out").string();
        options.method = "rar";

        Application app(std::move(options));
        auto envelope = app.execute();
        REQUIRE(envelope["success"] == false);
        REQUIRE(envelope["error"] == "unsupported compression method: rar");
    }

    SECTION("CLI flags override configuration") {
        writeFile(configDir / "config.json", R"({"network": {"concurrency": 3}})");

        auto options = baseOptions(configDir, "dns");
        options.domains = {"localhost"};
        options.concurrency = 7;

        Application app(std::move(options));
        auto envelope = app.execute();
        REQUIRE(envelope["success"] == true);
        REQUIRE(envelope["data"]["concurrency"] == 7);
        REQUIRE(app.config().config().network.concurrency == 3);
    }
}
