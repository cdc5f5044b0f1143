#ifndef WEAVEPACK_HTTP_TRANSPORT_HPP
#define WEAVEPACK_HTTP_TRANSPORT_HPP

#include <asio.hpp>
#include <asio/ssl.hpp>

#include "transport.hpp"
#include "../common/config.hpp"

/**
 * @brief Blocking HTTP/1.1 client over asio, with TLS for https gateways.
 *
 * Every request opens its own connection and sends "Connection: close".
 */
class HttpTransport : public Transport {
public:
    explicit HttpTransport(GatewayConfig config);

    HttpResponse get(const std::string& path) override;
    HttpResponse post(const std::string& path, const std::string& body,
                      const std::string& content_type) override;

    const GatewayConfig& config() const { return config_; }

    /**
     * @brief Parses a complete response read up to connection close.
     *
     * Handles Content-Length and chunked transfer coding.
     * @throws NetworkError on a malformed response.
     */
    static HttpResponse parse_response(const std::string& raw);

private:
    HttpResponse request(const std::string& method, const std::string& path,
                         const std::string& body, const std::string& content_type);
    std::string build_request(const std::string& method, const std::string& path,
                              const std::string& body, const std::string& content_type) const;

    GatewayConfig config_;
    asio::io_context io_context_;
    asio::ssl::context ssl_context_;
};

#endif // WEAVEPACK_HTTP_TRANSPORT_HPP
