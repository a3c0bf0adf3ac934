#include "app/CommandLine.hpp"

#include <getopt.h>

#include <sstream>
#include <stdexcept>

namespace migengine::app {

namespace {

enum OptionId : int {
    OptConfig = 1000,
    OptLogLevel,
    OptMetrics,
    OptSource,
    OptDestination,
    OptFile,
    OptFiles,
    OptDirectory,
    OptExpected,
    OptAlgorithm,
    OptMethod,
    OptHost,
    OptHosts,
    OptPorts,
    OptDomains,
    OptConcurrency,
    OptTimeoutMs,
    OptIntervalMs,
    OptCount,
};

const struct option kLongOptions[] = {
    {"help", no_argument, nullptr, 'h'},
    {"config", required_argument, nullptr, OptConfig},
    {"log-level", required_argument, nullptr, OptLogLevel},
    {"metrics", no_argument, nullptr, OptMetrics},
    {"source", required_argument, nullptr, OptSource},
    {"destination", required_argument, nullptr, OptDestination},
    {"file", required_argument, nullptr, OptFile},
    {"files", required_argument, nullptr, OptFiles},
    {"directory", required_argument, nullptr, OptDirectory},
    {"expected", required_argument, nullptr, OptExpected},
    {"algorithm", required_argument, nullptr, OptAlgorithm},
    {"method", required_argument, nullptr, OptMethod},
    {"host", required_argument, nullptr, OptHost},
    {"hosts", required_argument, nullptr, OptHosts},
    {"ports", required_argument, nullptr, OptPorts},
    {"domains", required_argument, nullptr, OptDomains},
    {"concurrency", required_argument, nullptr, OptConcurrency},
    {"timeout-ms", required_argument, nullptr, OptTimeoutMs},
    {"interval-ms", required_argument, nullptr, OptIntervalMs},
    {"count", required_argument, nullptr, OptCount},
    {nullptr, 0, nullptr, 0},
};

int parseInt(const char* text, const char* option) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != std::string(text).size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("--") + option + " expects an integer, got '" +
                                    text + "'");
    }
}

void appendList(std::vector<std::string>& list, const std::string& value) {
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            list.push_back(item);
        }
    }
}

} // namespace

CommandLineOptions CommandLine::parse(int argc, char* argv[]) {
    CommandLineOptions options;
    std::vector<std::string>* activeList = nullptr;

    optind = 0; // full reinitialisation so parse() can be called repeatedly
    opterr = 0;

    // "+" stops at the first non-option so positionals can be attached to
    // the list option that precedes them.
    while (true) {
        int longIndex = 0;
        int opt = getopt_long(argc, argv, "+h", kLongOptions, &longIndex);

        if (opt == -1) {
            if (optind >= argc) {
                break;
            }
            std::string positional = argv[optind++];
            if (options.operation.empty() && activeList == nullptr) {
                options.operation = positional;
            } else if (activeList != nullptr) {
                appendList(*activeList, positional);
            } else {
                throw std::invalid_argument("unexpected argument: " + positional);
            }
            continue;
        }

        activeList = nullptr;
        switch (opt) {
            case 'h':
                options.help = true;
                break;
            case OptConfig:
                options.configDir = optarg;
                break;
            case OptLogLevel:
                options.logLevel = optarg;
                break;
            case OptMetrics:
                options.includeMetrics = true;
                break;
            case OptSource:
                options.source = optarg;
                break;
            case OptDestination:
                options.destination = optarg;
                break;
            case OptFile:
                options.file = optarg;
                break;
            case OptFiles:
                appendList(options.files, optarg);
                activeList = &options.files;
                break;
            case OptDirectory:
                options.directory = optarg;
                break;
            case OptExpected:
                options.expected = optarg;
                break;
            case OptAlgorithm:
                options.algorithm = optarg;
                break;
            case OptMethod:
                options.method = optarg;
                break;
            case OptHost:
                options.host = optarg;
                break;
            case OptHosts:
                appendList(options.hosts, optarg);
                activeList = &options.hosts;
                break;
            case OptPorts:
                appendList(options.ports, optarg);
                activeList = &options.ports;
                break;
            case OptDomains:
                appendList(options.domains, optarg);
                activeList = &options.domains;
                break;
            case OptConcurrency:
                options.concurrency = parseInt(optarg, "concurrency");
                break;
            case OptTimeoutMs:
                options.timeoutMs = parseInt(optarg, "timeout-ms");
                break;
            case OptIntervalMs:
                options.intervalMs = parseInt(optarg, "interval-ms");
                break;
            case OptCount:
                options.count = parseInt(optarg, "count");
                break;
            case ':':
            case '?':
            default: {
                std::string offending = optind > 0 && optind <= argc ? argv[optind - 1] : "";
                if (optopt != 0 && offending.rfind("--", 0) != 0) {
                    offending = std::string("-") + static_cast<char>(optopt);
                }
                throw std::invalid_argument("invalid or incomplete option: " + offending);
            }
        }
    }

    return options;
}

std::string CommandLine::usage() {
    return R"(Migration Engine - high performance file and network operations

Usage: migration-engine <operation> [options]

Operations:
  copy        --source P --destination P [--concurrency N]
  checksum    --files F... | --directory D [--concurrency N]
  verify      --file F --expected HEX --algorithm md5|sha1|sha256
  compress    --source P --destination P [--method gzip|zstd|tar|tar.gz|tar.zst]
  decompress  --source P --destination P [--method M]
  ping        --hosts H[:PORT]... [--timeout-ms N] [--concurrency N]
  portscan    --host H --ports P|A-B... [--timeout-ms N] [--concurrency N]
  dns         --domains D... [--concurrency N]
  transfer    --source S --destination D --method http|chunked|concurrent
  monitor     [--interval-ms N] [--count N]
  version

Global options:
  --config DIR       Configuration directory
  --log-level LEVEL  trace, debug, info, warn, error or off
  --metrics          Include the metrics summary in the output
  -h, --help         Show this help
)";
}

} // namespace migengine::app
