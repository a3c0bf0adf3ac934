#include "infrastructure/network/HttpClient.hpp"

#include "infrastructure/fileops/FileHandle.hpp"
#include "infrastructure/network/TcpDialer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace migengine::infra {

namespace {

constexpr const char* kUserAgent = "migration-engine";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void configure(httplib::Client& client, std::chrono::milliseconds timeout) {
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_follow_location(true);
    client.set_default_headers({{"User-Agent", kUserAgent}});
}

HttpResponse toHttpResponse(const httplib::Response& response) {
    HttpResponse converted;
    converted.status = response.status;
    converted.reason = response.reason;
    for (const auto& [name, value] : response.headers) {
        converted.headers[toLower(name)] = value;
    }
    return converted;
}

[[noreturn]] void throwRequestError(const std::string& method, const std::string& url,
                                    httplib::Error error) {
    throw std::runtime_error(method + " " + url + " failed: " + httplib::to_string(error));
}

} // namespace

HttpUrl HttpUrl::parse(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("invalid URL: " + url);
    }

    auto scheme = toLower(url.substr(0, schemeEnd));
    if (scheme != "http") {
        throw std::invalid_argument("unsupported URL scheme: " + scheme);
    }

    auto rest = url.substr(schemeEnd + 3);
    auto pathStart = rest.find_first_of("/?#");
    auto authority = rest.substr(0, pathStart);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        throw std::invalid_argument("missing host in URL: " + url);
    }

    HttpUrl parsed;
    auto [host, port] = splitHostPort(authority, 80);
    parsed.host = host;
    parsed.port = port;

    if (pathStart != std::string::npos) {
        auto target = rest.substr(pathStart);
        target = target.substr(0, target.find('#'));
        if (target.empty() || target.front() != '/') {
            target.insert(0, "/");
        }
        parsed.target = target;
    }
    return parsed;
}

std::string HttpUrl::lastPathSegment() const {
    auto path = target.substr(0, target.find('?'));
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.rfind('/');
    auto segment = slash == std::string::npos ? path : path.substr(slash + 1);
    return segment == "." || segment == ".." ? std::string{} : segment;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout, size_t chunkSize)
    : timeout_(timeout), chunkSize_(chunkSize > 0 ? chunkSize : 64 * 1024) {}

HttpResponse HttpClient::get(const std::string& url, const BodySink& sink) {
    auto parsed = HttpUrl::parse(url);
    httplib::Client client(parsed.host, parsed.port);
    configure(client, timeout_);

    // Redirect responses never reach the handlers while follow_location is on
    HttpResponse response;
    auto result = client.Get(
        parsed.target,
        [&response](const httplib::Response& head) {
            response = toHttpResponse(head);
            return true;
        },
        [&response, &sink](const char* data, size_t size) {
            if (response.isSuccess()) {
                sink(data, size);
                response.bodyBytes += static_cast<int64_t>(size);
            }
            return true;
        });

    if (!result) {
        throwRequestError("GET", url, result.error());
    }
    if (response.status == 0) {
        response = toHttpResponse(*result);
    }
    spdlog::debug("GET {} -> {} ({} bytes)", url, response.status, response.bodyBytes);
    return response;
}

HttpResponse HttpClient::put(const std::string& url, const std::filesystem::path& file) {
    auto parsed = HttpUrl::parse(url);
    auto input = FileHandle::openForRead(file);
    auto size = static_cast<size_t>(input.size());

    httplib::Client client(parsed.host, parsed.port);
    configure(client, timeout_);

    std::vector<char> chunk(chunkSize_);
    auto result = client.Put(
        parsed.target, size,
        [&input, &chunk](size_t /*offset*/, size_t length, httplib::DataSink& sink) {
            size_t n = input.read(chunk.data(), std::min(length, chunk.size()));
            return n > 0 && sink.write(chunk.data(), n);
        },
        "application/octet-stream");

    if (!result) {
        throwRequestError("PUT", url, result.error());
    }
    auto response = toHttpResponse(*result);
    spdlog::debug("PUT {} ({} bytes) -> {}", url, size, response.status);
    return response;
}

} // namespace migengine::infra
