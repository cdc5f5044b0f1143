#include "network/gateway_client.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json";

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

HttpResponse GatewayClient::checked(HttpResponse response) {
    if (response.status >= 400) {
        LOG_ERR("Gateway returned ", response.status, ": ", response.body);
        throw UploadError(response.status, response.body);
    }
    return response;
}

std::vector<uint8_t> GatewayClient::get_tx_anchor() {
    HttpResponse response = checked(transport_.get("/tx_anchor"));
    return Base64::url_decode(trim(response.body));
}

std::string GatewayClient::get_price(uint64_t byte_count, const std::vector<uint8_t>& target) {
    std::string path = "/price/" + std::to_string(byte_count);
    if (!target.empty()) {
        path += "/" + Base64::url_encode(target);
    }
    std::string price = trim(checked(transport_.get(path)).body);
    if (price.empty() || price.find_first_not_of("0123456789") != std::string::npos) {
        throw NetworkError("gateway returned a non-numeric price '" + price + "'");
    }
    return price;
}

void GatewayClient::submit_transaction(const Transaction& tx, bool include_data) {
    checked(transport_.post("/tx", tx.to_json(include_data).dump(), JSON_CONTENT_TYPE));
    LOG_DEBUG("Posted transaction ", tx.id_b64());
}

void GatewayClient::submit_chunk(const ChunkUpload& chunk) {
    nlohmann::json body = chunk;
    checked(transport_.post("/chunk", body.dump(), JSON_CONTENT_TYPE));
    LOG_DEBUG("Posted chunk at offset ", chunk.offset);
}
