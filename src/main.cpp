#include "app/Application.hpp"
#include "app/CommandLine.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    migengine::app::CommandLineOptions options;
    try {
        options = migengine::app::CommandLine::parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        nlohmann::json envelope = {{"success", false}, {"error", e.what()}};
        std::cout << envelope.dump(2) << std::endl;
        std::cerr << migengine::app::CommandLine::usage();
        return 1;
    }

    if (options.help) {
        std::cout << migengine::app::CommandLine::usage();
        return 0;
    }
    if (options.operation.empty()) {
        std::cerr << migengine::app::CommandLine::usage();
        return 1;
    }

    try {
        migengine::app::Application app(std::move(options));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        nlohmann::json envelope = {{"success", false}, {"error", e.what()}};
        std::cout << envelope.dump(2) << std::endl;
        return 1;
    }
}
