#ifndef WEAVEPACK_CONFIG_HPP
#define WEAVEPACK_CONFIG_HPP

#include <string>
#include <cstdint>

constexpr const char* DEFAULT_GATEWAY_URL = "https://arweave.net";
constexpr uint16_t DEFAULT_HTTP_PORT = 80;
constexpr uint16_t DEFAULT_HTTPS_PORT = 443;

// Where gateway requests are sent.
struct GatewayConfig {
    std::string scheme = "https";
    std::string host = "arweave.net";
    uint16_t port = DEFAULT_HTTPS_PORT;

    bool use_tls() const { return scheme == "https"; }
    std::string url() const;

    /**
     * @brief Parses `scheme://host[:port][/]`. Only http and https are accepted.
     * @throws LedgerError on any other shape.
     */
    static GatewayConfig from_url(const std::string& url);
};

#endif // WEAVEPACK_CONFIG_HPP
