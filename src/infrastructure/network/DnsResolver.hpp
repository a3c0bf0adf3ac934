#pragma once

#include <string>
#include <vector>

namespace migengine::infra {

/**
 * @brief Blocking DNS queries through the system resolver.
 *
 * Addresses and the canonical name come from getaddrinfo. MX and TXT
 * records are queried with the thread-safe libresolv interface. Every
 * function may be called concurrently from multiple threads.
 */
class DnsResolver {
public:
    /**
     * @brief Resolves IPv4 and IPv6 addresses, de-duplicated in resolver order.
     * @throws std::runtime_error with the resolver message on failure.
     */
    static std::vector<std::string> resolveAddresses(const std::string& domain);

    /**
     * @brief Returns the canonical name without its trailing dot, or empty.
     */
    static std::string canonicalName(const std::string& domain);

    /**
     * @brief Returns mail exchangers rendered as "host (priority: n)".
     */
    static std::vector<std::string> mailExchangers(const std::string& domain);

    /**
     * @brief Returns TXT records, the character-strings of each record joined.
     */
    static std::vector<std::string> textRecords(const std::string& domain);
};

} // namespace migengine::infra
