#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace migengine::test {

/**
 * @brief Scratch directory under the system temp path, removed on destruction.
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "migengine_test") {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/// Pseudo-random bytes with a fixed seed, effectively incompressible.
inline std::string randomBytes(size_t size, uint32_t seed = 42) {
    std::mt19937 engine(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>(dist(engine));
    }
    return data;
}

/**
 * @brief httplib::Server bound to an ephemeral port on 127.0.0.1.
 *
 * Every GET, PUT and POST is routed to one handler. The server listens on
 * its own thread from construction until stop().
 */
class LocalHttpServer {
public:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    explicit LocalHttpServer(Handler handler) : handler_(std::move(handler)) {
        auto route = [this](const httplib::Request& request, httplib::Response& response) {
            ++requests_;
            handler_(request, response);
        };
        server_.Get(".*", route);
        server_.Put(".*", route);
        server_.Post(".*", route);

        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) {
            throw std::runtime_error("failed to bind test HTTP server");
        }
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LocalHttpServer() { stop(); }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    void stop() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }
    int requestCount() const { return requests_.load(); }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    static void reply(httplib::Response& response, int status, const std::string& body) {
        response.status = status;
        response.set_content(body, "application/octet-stream");
    }

private:
    Handler handler_;
    httplib::Server server_;
    int port_{0};
    std::thread thread_;
    std::atomic<int> requests_{0};
};

} // namespace migengine::test
