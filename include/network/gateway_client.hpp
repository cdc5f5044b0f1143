#ifndef WEAVEPACK_GATEWAY_CLIENT_HPP
#define WEAVEPACK_GATEWAY_CLIENT_HPP

#include "transport.hpp"
#include "../tx/transaction.hpp"
#include <string>
#include <vector>

/**
 * @brief Typed calls against the gateway HTTP API.
 *
 * Any response with status >= 400 raises UploadError carrying the status and body.
 */
class GatewayClient {
public:
    explicit GatewayClient(Transport& transport) : transport_(transport) {}

    // GET /tx_anchor: a recent block or transaction id used as last_tx.
    std::vector<uint8_t> get_tx_anchor();

    // GET /price/{bytes}[/{target}]: reward in winston as a decimal string.
    std::string get_price(uint64_t byte_count, const std::vector<uint8_t>& target = {});

    // POST /tx
    void submit_transaction(const Transaction& tx, bool include_data);

    // POST /chunk
    void submit_chunk(const ChunkUpload& chunk);

private:
    HttpResponse checked(HttpResponse response);

    Transport& transport_;
};

#endif // WEAVEPACK_GATEWAY_CLIENT_HPP
