#ifndef WEAVEPACK_TRANSPORT_HPP
#define WEAVEPACK_TRANSPORT_HPP

#include <string>

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Request/response channel to a gateway. Paths are absolute ("/tx_anchor").
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse get(const std::string& path) = 0;
    virtual HttpResponse post(const std::string& path, const std::string& body,
                              const std::string& content_type) = 0;
};

#endif // WEAVEPACK_TRANSPORT_HPP
