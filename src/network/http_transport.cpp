#include "network/http_transport.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

template <typename Stream>
std::string read_until_close(Stream& stream) {
    std::string response;
    std::array<char, 8192> buffer;
    for (;;) {
        asio::error_code ec;
        size_t n = stream.read_some(asio::buffer(buffer), ec);
        response.append(buffer.data(), n);
        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            break;
        }
        if (ec) {
            throw asio::system_error(ec);
        }
    }
    return response;
}

std::string decode_chunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;
    for (;;) {
        size_t line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw NetworkError("truncated chunked body");
        }
        std::string size_field = body.substr(pos, line_end - pos);
        size_t extension = size_field.find(';');
        if (extension != std::string::npos) {
            size_field.resize(extension);
        }
        size_t size = 0;
        try {
            size = std::stoul(size_field, nullptr, 16);
        } catch (const std::exception&) {
            throw NetworkError("bad chunk size '" + size_field + "'");
        }
        pos = line_end + 2;
        if (size == 0) {
            return decoded;
        }
        if (pos + size > body.size()) {
            throw NetworkError("truncated chunked body");
        }
        decoded.append(body, pos, size);
        pos += size + 2;
    }
}

} // namespace

HttpTransport::HttpTransport(GatewayConfig config)
    : config_(std::move(config)), ssl_context_(asio::ssl::context::tls_client) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(asio::ssl::verify_peer);
}

HttpResponse HttpTransport::get(const std::string& path) {
    return request("GET", path, "", "");
}

HttpResponse HttpTransport::post(const std::string& path, const std::string& body,
                                 const std::string& content_type) {
    return request("POST", path, body, content_type);
}

std::string HttpTransport::build_request(const std::string& method, const std::string& path,
                                         const std::string& body, const std::string& content_type) const {
    std::ostringstream request;
    request << method << " " << path << " HTTP/1.1\r\n";
    request << "Host: " << config_.host << "\r\n";
    request << "Accept: */*\r\n";
    request << "Connection: close\r\n";
    if (method == "POST") {
        request << "Content-Type: " << content_type << "\r\n";
        request << "Content-Length: " << body.size() << "\r\n";
    }
    request << "\r\n" << body;
    return request.str();
}

HttpResponse HttpTransport::request(const std::string& method, const std::string& path,
                                    const std::string& body, const std::string& content_type) {
    LOG_DEBUG(method, " ", config_.url(), path, " (", body.size(), " bytes)");
    std::string request = build_request(method, path, body, content_type);
    std::string raw;

    try {
        asio::ip::tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port));

        if (config_.use_tls()) {
            asio::ssl::stream<asio::ip::tcp::socket> stream(io_context_, ssl_context_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
                throw NetworkError("cannot set TLS server name for " + config_.host);
            }
            stream.set_verify_callback(asio::ssl::host_name_verification(config_.host));
            asio::connect(stream.lowest_layer(), endpoints);
            stream.handshake(asio::ssl::stream_base::client);
            asio::write(stream, asio::buffer(request));
            raw = read_until_close(stream);
        } else {
            asio::ip::tcp::socket socket(io_context_);
            asio::connect(socket, endpoints);
            asio::write(socket, asio::buffer(request));
            raw = read_until_close(socket);
        }
    } catch (const asio::system_error& e) {
        throw NetworkError(config_.host + ": " + e.what());
    }

    HttpResponse response = parse_response(raw);
    LOG_DEBUG(method, " ", path, " -> ", response.status);
    return response;
}

HttpResponse HttpTransport::parse_response(const std::string& raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw NetworkError("response has no header terminator");
    }

    std::istringstream headers(raw.substr(0, header_end));
    std::string status_line;
    std::getline(headers, status_line);

    HttpResponse response;
    std::istringstream status_stream(status_line);
    std::string version;
    if (!(status_stream >> version >> response.status) || version.rfind("HTTP/", 0) != 0) {
        throw NetworkError("bad status line '" + status_line + "'");
    }

    bool chunked = false;
    long long content_length = -1;
    std::string line;
    while (std::getline(headers, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        if (name == "transfer-encoding" && lower(value).find("chunked") != std::string::npos) {
            chunked = true;
        } else if (name == "content-length") {
            try {
                content_length = std::stoll(value);
            } catch (const std::exception&) {
                throw NetworkError("bad content-length '" + value + "'");
            }
        }
    }

    std::string body = raw.substr(header_end + 4);
    if (chunked) {
        response.body = decode_chunked(body);
    } else if (content_length >= 0) {
        if (static_cast<size_t>(content_length) > body.size()) {
            throw NetworkError("response body shorter than content-length");
        }
        response.body = body.substr(0, static_cast<size_t>(content_length));
    } else {
        response.body = body;
    }
    return response;
}
