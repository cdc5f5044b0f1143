#include "common/config.hpp"
#include "common/errors.hpp"

std::string GatewayConfig::url() const {
    std::string result = scheme + "://" + host;
    bool default_port = (use_tls() && port == DEFAULT_HTTPS_PORT) || (!use_tls() && port == DEFAULT_HTTP_PORT);
    if (!default_port) {
        result += ":" + std::to_string(port);
    }
    return result;
}

GatewayConfig GatewayConfig::from_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw LedgerError("gateway url has no scheme: " + url);
    }

    GatewayConfig config;
    config.scheme = url.substr(0, scheme_end);
    if (config.scheme != "http" && config.scheme != "https") {
        throw LedgerError("unsupported gateway scheme: " + config.scheme);
    }
    config.port = config.use_tls() ? DEFAULT_HTTPS_PORT : DEFAULT_HTTP_PORT;

    std::string authority = url.substr(scheme_end + 3);
    size_t slash = authority.find('/');
    if (slash != std::string::npos) {
        if (authority.find_first_not_of('/', slash) != std::string::npos) {
            throw LedgerError("gateway url must not carry a path: " + url);
        }
        authority.resize(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos) {
            throw LedgerError("bad gateway port: " + port);
        }
        unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) {
            throw LedgerError("bad gateway port: " + port);
        }
        config.port = static_cast<uint16_t>(value);
        authority.resize(colon);
    }

    if (authority.empty()) {
        throw LedgerError("gateway url has no host: " + url);
    }
    config.host = authority;
    return config;
}
