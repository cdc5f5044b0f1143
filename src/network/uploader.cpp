#include "network/uploader.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

TransactionUploader::TransactionUploader(GatewayClient& client, const Transaction& tx, std::vector<uint8_t> data)
    : client_(client), tx_(tx), data_(std::move(data)) {
    if (!tx_.is_signed()) {
        throw LedgerError("transaction must be signed before upload");
    }
    if (data_.size() != tx_.data_size()) {
        throw LedgerError("upload data size " + std::to_string(data_.size()) +
                          " does not match transaction data_size " + std::to_string(tx_.data_size()));
    }
    if (!data_.empty() && !tx_.chunk_data()) {
        tx_.prepare_chunks(data_);
    }
}

size_t TransactionUploader::total_chunks() const {
    return tx_.chunk_data() ? tx_.chunk_data()->chunks.size() : 0;
}

bool TransactionUploader::is_complete() const {
    if (!tx_posted_) {
        return false;
    }
    return data_in_body() || uploaded_chunks_ == total_chunks();
}

int TransactionUploader::pct_complete() const {
    if (is_complete()) {
        return 100;
    }
    if (total_chunks() == 0) {
        return 0;
    }
    return static_cast<int>(uploaded_chunks_ * 100 / total_chunks());
}

void TransactionUploader::post_transaction() {
    if (tx_posted_) {
        return;
    }
    client_.submit_transaction(tx_, data_in_body());
    tx_posted_ = true;
    LOG_INFO("Transaction ", tx_.id_b64(), " posted, ", total_chunks(), " chunks");
}

void TransactionUploader::upload_chunk() {
    if (!tx_posted_) {
        post_transaction();
        return;
    }
    if (is_complete()) {
        return;
    }
    client_.submit_chunk(tx_.get_chunk(uploaded_chunks_, data_));
    ++uploaded_chunks_;
    LOG_DEBUG("Uploaded chunk ", uploaded_chunks_, "/", total_chunks());
}

void TransactionUploader::upload() {
    post_transaction();
    while (!is_complete()) {
        upload_chunk();
    }
}
