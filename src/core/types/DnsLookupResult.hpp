/**
 * @file DnsLookupResult.hpp
 * @brief Result of resolving a domain name.
 */

#pragma once

#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Records resolved for a single domain.
 *
 * Only the address lookup is mandatory. CNAME, MX and TXT are best-effort
 * and left empty when the lookup fails or returns nothing.
 */
struct DnsLookupResult {
    std::string domain;            ///< Queried domain name
    std::vector<std::string> ips;  ///< IPv4 and IPv6 addresses
    std::string cname;             ///< Canonical name, only when it differs from the query
    std::vector<std::string> mx;   ///< Mail exchangers as "host (priority: n)"
    std::vector<std::string> txt;  ///< TXT record strings

    bool operator==(const DnsLookupResult& other) const = default;
};

} // namespace migengine::core
