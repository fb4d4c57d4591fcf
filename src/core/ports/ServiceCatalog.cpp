#include "core/ports/ServiceCatalog.hpp"

#include <utility>

namespace dockports::core {

ServiceCatalog::ServiceCatalog(std::map<uint16_t, std::string> userMappings)
    : userMappings_(std::move(userMappings)) {}

std::string ServiceCatalog::lookup(uint16_t port) const {
    {
        std::lock_guard lock(mutex_);
        auto it = userMappings_.find(port);
        if (it != userMappings_.end()) {
            return it->second;
        }
    }

    const auto& services = getKnownServices();
    auto it = services.find(port);
    return it != services.end() ? it->second : kUnknownService;
}

std::optional<std::string> ServiceCatalog::userMapping(uint16_t port) const {
    std::lock_guard lock(mutex_);
    auto it = userMappings_.find(port);
    if (it == userMappings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ServiceCatalog::setMapping(uint16_t port, const std::string& serviceName) {
    std::lock_guard lock(mutex_);
    userMappings_[port] = serviceName;
}

void ServiceCatalog::replaceMappings(std::map<uint16_t, std::string> userMappings) {
    std::lock_guard lock(mutex_);
    userMappings_ = std::move(userMappings);
}

std::map<uint16_t, std::string> ServiceCatalog::userMappings() const {
    std::lock_guard lock(mutex_);
    return userMappings_;
}

const std::unordered_map<uint16_t, std::string>& ServiceCatalog::getKnownServices() {
    static const std::unordered_map<uint16_t, std::string> services = {
        {21, "FTP"},           {22, "SSH"},              {23, "Telnet"},
        {25, "SMTP"},          {53, "DNS"},              {67, "DHCP Server"},
        {68, "DHCP Client"},   {69, "TFTP"},             {80, "HTTP"},
        {110, "POP3"},         {123, "NTP"},             {135, "RPC"},
        {137, "NetBIOS Name"}, {138, "NetBIOS Datagram"}, {139, "NetBIOS Session"},
        {143, "IMAP"},         {161, "SNMP"},            {389, "LDAP"},
        {443, "HTTPS"},        {445, "SMB"},             {465, "SMTPS"},
        {514, "Syslog"},       {587, "SMTP"},            {631, "IPP"},
        {636, "LDAPS"},        {993, "IMAPS"},           {995, "POP3S"},
        {1433, "SQL Server"},  {1521, "Oracle"},         {3306, "MySQL"},
        {3389, "RDP"},         {5432, "PostgreSQL"},     {5900, "VNC"},
        {6379, "Redis"},       {8080, "HTTP Proxy"},     {8443, "HTTPS Alt"},
        {9200, "Elasticsearch"}, {27017, "MongoDB"}};
    return services;
}

} // namespace dockports::core
