#include "infrastructure/network/DnsResolver.hpp"

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <resolv.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

namespace migengine::infra {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { freeaddrinfo(info); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

std::string stripTrailingDot(std::string name) {
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    return name;
}

/// Per-call resolver state for res_nquery.
class ResolverState {
public:
    ResolverState() : initialized_(res_ninit(&state_) == 0) {}
    ~ResolverState() {
        if (initialized_) {
            res_nclose(&state_);
        }
    }
    ResolverState(const ResolverState&) = delete;
    ResolverState& operator=(const ResolverState&) = delete;

    bool ok() const { return initialized_; }
    res_state get() { return &state_; }

private:
    struct __res_state state_ {};
    bool initialized_;
};

/// Runs a query and invokes fn(message, record) for every answer of the given type.
template <typename Fn>
void forEachAnswer(const std::string& domain, int type, Fn&& fn) {
    ResolverState resolver;
    if (!resolver.ok()) {
        spdlog::debug("Resolver initialisation failed for {}", domain);
        return;
    }

    std::array<unsigned char, NS_PACKETSZ * 16> answer{};
    int length = res_nquery(resolver.get(), domain.c_str(), ns_c_in, type, answer.data(),
                            static_cast<int>(answer.size()));
    if (length < 0) {
        spdlog::debug("No records of type {} for {}", type, domain);
        return;
    }

    ns_msg message;
    if (ns_initparse(answer.data(), length, &message) != 0) {
        spdlog::debug("Malformed DNS response for {}", domain);
        return;
    }

    int count = ns_msg_count(message, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr record;
        if (ns_parserr(&message, ns_s_an, i, &record) != 0) {
            continue;
        }
        if (ns_rr_type(record) != type) {
            continue;
        }
        fn(message, record);
    }
}

} // namespace

std::vector<std::string> DnsResolver::resolveAddresses(const std::string& domain) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(domain.c_str(), nullptr, &hints, &raw);
    if (rc != 0) {
        throw std::runtime_error("lookup " + domain + ": " + gai_strerror(rc));
    }
    AddrInfoPtr info(raw);

    std::vector<std::string> addresses;
    for (auto* entry = info.get(); entry != nullptr; entry = entry->ai_next) {
        char buffer[INET6_ADDRSTRLEN] = {};
        const void* address = nullptr;
        if (entry->ai_family == AF_INET) {
            address = &reinterpret_cast<sockaddr_in*>(entry->ai_addr)->sin_addr;
        } else if (entry->ai_family == AF_INET6) {
            address = &reinterpret_cast<sockaddr_in6*>(entry->ai_addr)->sin6_addr;
        } else {
            continue;
        }
        if (inet_ntop(entry->ai_family, address, buffer, sizeof(buffer)) == nullptr) {
            continue;
        }
        std::string text(buffer);
        if (std::find(addresses.begin(), addresses.end(), text) == addresses.end()) {
            addresses.push_back(std::move(text));
        }
    }
    return addresses;
}

std::string DnsResolver::canonicalName(const std::string& domain) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_CANONNAME;

    addrinfo* raw = nullptr;
    if (getaddrinfo(domain.c_str(), nullptr, &hints, &raw) != 0) {
        return {};
    }
    AddrInfoPtr info(raw);

    if (info->ai_canonname == nullptr) {
        return {};
    }
    return stripTrailingDot(info->ai_canonname);
}

std::vector<std::string> DnsResolver::mailExchangers(const std::string& domain) {
    std::vector<std::string> exchangers;
    forEachAnswer(domain, ns_t_mx, [&](const ns_msg& message, const ns_rr& record) {
        if (ns_rr_rdlen(record) < NS_INT16SZ) {
            return;
        }
        const unsigned char* rdata = ns_rr_rdata(record);
        unsigned priority = ns_get16(rdata);

        char name[NS_MAXDNAME] = {};
        if (ns_name_uncompress(ns_msg_base(message), ns_msg_end(message), rdata + NS_INT16SZ,
                               name, sizeof(name)) < 0) {
            return;
        }
        exchangers.push_back(stripTrailingDot(name) + " (priority: " + std::to_string(priority) +
                             ")");
    });
    return exchangers;
}

std::vector<std::string> DnsResolver::textRecords(const std::string& domain) {
    std::vector<std::string> records;
    forEachAnswer(domain, ns_t_txt, [&](const ns_msg&, const ns_rr& record) {
        const unsigned char* data = ns_rr_rdata(record);
        const unsigned char* end = data + ns_rr_rdlen(record);

        std::string text;
        while (data < end) {
            size_t length = *data++;
            if (data + length > end) {
                break;
            }
            text.append(reinterpret_cast<const char*>(data), length);
            data += length;
        }
        records.push_back(std::move(text));
    });
    return records;
}

} // namespace migengine::infra
