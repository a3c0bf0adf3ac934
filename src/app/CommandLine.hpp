#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace migengine::app {

/**
 * @brief Parsed command line of the migration-engine executable.
 *
 * Fields are empty when the corresponding option was not given, so that
 * configuration defaults can fill them in.
 */
struct CommandLineOptions {
    std::string operation; ///< First positional argument

    // Global options
    std::optional<std::filesystem::path> configDir;
    std::optional<std::string> logLevel;
    bool includeMetrics{false};
    bool help{false};

    // Operation options
    std::string source;
    std::string destination;
    std::string file;
    std::string directory;
    std::string expected;
    std::string algorithm;
    std::string method;
    std::string host;
    std::vector<std::string> files;
    std::vector<std::string> hosts;
    std::vector<std::string> ports;
    std::vector<std::string> domains;
    std::optional<int> concurrency;
    std::optional<int> timeoutMs;
    std::optional<int> intervalMs;
    std::optional<int> count;
};

/**
 * @brief getopt_long based parser for "migration-engine <operation> [options]".
 *
 * List options (--files, --hosts, --ports, --domains) take every following
 * non-option argument, and may also be repeated or given comma-separated
 * values.
 */
class CommandLine {
public:
    /**
     * @brief Parses argv.
     * @throws std::invalid_argument for unknown options, missing values or
     *         non-numeric integers.
     */
    static CommandLineOptions parse(int argc, char* argv[]);

    /**
     * @brief Returns the usage text.
     */
    static std::string usage();
};

} // namespace migengine::app
