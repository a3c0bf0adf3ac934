#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace migengine::infra {

/**
 * @brief Parsed http:// URL.
 */
struct HttpUrl {
    std::string host;       ///< Host name or address (IPv6 without brackets)
    uint16_t port{80};      ///< TCP port
    std::string target{"/"}; ///< Path and query sent in the request line

    /**
     * @brief Parses an absolute http:// URL.
     * @throws std::invalid_argument for other schemes or malformed URLs.
     */
    static HttpUrl parse(const std::string& url);

    /**
     * @brief Returns the last non-empty path segment, without the query.
     */
    std::string lastPathSegment() const;
};

/**
 * @brief Status and headers of an HTTP response.
 */
struct HttpResponse {
    int status{0};                              ///< Status code
    std::string reason;                         ///< Reason phrase
    std::map<std::string, std::string> headers; ///< Header names lowercased
    int64_t bodyBytes{0};                       ///< Body bytes delivered to the sink

    bool isSuccess() const { return status >= 200 && status < 300; }
    std::string statusLine() const { return std::to_string(status) + " " + reason; }
};

/**
 * @brief Blocking HTTP/1.1 client on top of httplib::Client.
 *
 * Every request uses a fresh connection. The timeout applies to connecting
 * and to each read or write on the socket. Redirects are followed, and bodies
 * of successful responses are streamed to a caller-supplied sink.
 */
class HttpClient {
public:
    using BodySink = std::function<void(const char* data, size_t size)>;

    explicit HttpClient(std::chrono::milliseconds timeout, size_t chunkSize = 64 * 1024);

    /**
     * @brief Sends a GET request.
     * @param url Absolute http:// URL.
     * @param sink Receives the body of a 2xx response in chunks.
     * @return Final response after redirects.
     * @throws std::invalid_argument for an unsupported URL.
     * @throws std::runtime_error on connection errors, timeout or a truncated body.
     */
    HttpResponse get(const std::string& url, const BodySink& sink);

    /**
     * @brief Streams a file as the body of a PUT request.
     * @throws std::invalid_argument for an unsupported URL.
     * @throws std::runtime_error on I/O or connection errors or timeout.
     */
    HttpResponse put(const std::string& url, const std::filesystem::path& file);

private:
    std::chrono::milliseconds timeout_;
    size_t chunkSize_;
};

} // namespace migengine::infra
