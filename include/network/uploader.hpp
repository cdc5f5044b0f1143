#ifndef WEAVEPACK_UPLOADER_HPP
#define WEAVEPACK_UPLOADER_HPP

#include "gateway_client.hpp"
#include <vector>

/**
 * @brief Posts a signed transaction and then its chunks, one call at a time.
 *
 * A payload of at most MAX_CHUNKS_IN_BODY chunks travels inside the transaction
 * body and needs no chunk uploads. Failures propagate; nothing is retried.
 */
class TransactionUploader {
public:
    static constexpr size_t MAX_CHUNKS_IN_BODY = 1;

    TransactionUploader(GatewayClient& client, const Transaction& tx, std::vector<uint8_t> data);

    void post_transaction();

    // Posts the next pending chunk. Posts the transaction first if that has not happened.
    void upload_chunk();

    // Runs post_transaction and upload_chunk until complete.
    void upload();

    bool is_complete() const;
    size_t total_chunks() const;
    size_t uploaded_chunks() const { return uploaded_chunks_; }
    int pct_complete() const;
    bool transaction_posted() const { return tx_posted_; }

private:
    bool data_in_body() const { return total_chunks() <= MAX_CHUNKS_IN_BODY; }

    GatewayClient& client_;
    Transaction tx_;
    std::vector<uint8_t> data_;
    bool tx_posted_ = false;
    size_t uploaded_chunks_ = 0;
};

#endif // WEAVEPACK_UPLOADER_HPP
