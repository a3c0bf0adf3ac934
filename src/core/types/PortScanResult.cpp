#include "core/types/PortScanResult.hpp"

#include <sstream>
#include <stdexcept>

namespace migengine::core {

namespace {

uint16_t parsePort(const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port: '" + text + "'");
    }
    if (consumed != text.size() || value < 1 || value > 65535) {
        throw std::invalid_argument("invalid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

} // namespace

std::vector<uint16_t> parsePortList(const std::vector<std::string>& specs) {
    std::vector<uint16_t> ports;

    for (const auto& spec : specs) {
        std::stringstream ss(spec);
        std::string token;
        while (std::getline(ss, token, ',')) {
            if (token.empty()) {
                continue;
            }

            auto dash = token.find('-');
            if (dash == std::string::npos) {
                ports.push_back(parsePort(token));
                continue;
            }

            uint16_t first = parsePort(token.substr(0, dash));
            uint16_t last = parsePort(token.substr(dash + 1));
            if (first > last) {
                throw std::invalid_argument("invalid port range: '" + token + "'");
            }
            for (int p = first; p <= last; ++p) {
                ports.push_back(static_cast<uint16_t>(p));
            }
        }
    }

    return ports;
}

const std::unordered_map<uint16_t, std::string>& ServiceDetector::getKnownServices() {
    static const std::unordered_map<uint16_t, std::string> services = {
        {20, "FTP-Data"},   {21, "FTP"},          {22, "SSH"},          {23, "Telnet"},
        {25, "SMTP"},       {53, "DNS"},          {80, "HTTP"},         {110, "POP3"},
        {143, "IMAP"},      {443, "HTTPS"},       {993, "IMAPS"},       {995, "POP3S"},
        {1433, "MSSQL"},    {1521, "Oracle"},     {3306, "MySQL"},      {3389, "RDP"},
        {5432, "PostgreSQL"}, {5900, "VNC"},      {6379, "Redis"},      {8080, "HTTP-Alt"},
        {8443, "HTTPS-Alt"}, {9200, "Elasticsearch"}, {11211, "Memcached"},
        {27017, "MongoDB"}};
    return services;
}

std::string ServiceDetector::detectService(uint16_t port) {
    const auto& services = getKnownServices();
    auto it = services.find(port);
    return it != services.end() ? it->second : "Unknown";
}

} // namespace migengine::core
