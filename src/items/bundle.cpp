#include "items/bundle.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace {

BundleHeader make_header(const DataItem& item) {
    if (!item.is_signed()) {
        throw FormatError("cannot bundle an unsigned data item");
    }
    BundleHeader header;
    header.id = item.id();
    header.size = item.raw_size();

    std::vector<uint8_t> entry;
    entry.reserve(Bundle::HEADER_ENTRY_SIZE);
    Serializer::append_le(entry, header.size, Serializer::WIDE_INT_SIZE);
    entry.insert(entry.end(), header.id.begin(), header.id.end());
    std::copy(entry.begin(), entry.end(), header.raw.begin());
    return header;
}

std::vector<uint8_t> encode_header_table(const std::vector<BundleHeader>& headers) {
    std::vector<uint8_t> table;
    table.reserve(Serializer::WIDE_INT_SIZE + headers.size() * Bundle::HEADER_ENTRY_SIZE);
    Serializer::append_le(table, headers.size(), Serializer::WIDE_INT_SIZE);
    for (const auto& header : headers) {
        table.insert(table.end(), header.raw.begin(), header.raw.end());
    }
    return table;
}

} // namespace

Bundle Bundle::create(const std::vector<DataItem>& items) {
    Bundle bundle;
    for (const auto& item : items) {
        bundle.headers_.push_back(make_header(item));
    }

    bundle.raw_ = encode_header_table(bundle.headers_);
    for (const auto& item : items) {
        Serializer::append(bundle.raw_, item.get_raw_with_data());
    }
    bundle.items_ = items;

    LOG_DEBUG("Created bundle of ", items.size(), " items, ", bundle.raw_.size(), " bytes");
    return bundle;
}

void Bundle::write_to(const std::vector<DataItem>& items, std::ostream& out) {
    std::vector<BundleHeader> headers;
    headers.reserve(items.size());
    for (const auto& item : items) {
        headers.push_back(make_header(item));
    }

    std::vector<uint8_t> table = encode_header_table(headers);
    out.write(reinterpret_cast<const char*>(table.data()), static_cast<std::streamsize>(table.size()));
    for (const auto& item : items) {
        item.write_raw_to(out);
    }
    if (!out) {
        throw IOError("failed writing bundle");
    }
}

Bundle Bundle::decode(const std::vector<uint8_t>& raw) {
    Serializer::ByteReader reader(raw);
    uint64_t count = reader.take_le(Serializer::WIDE_INT_SIZE, "item count");
    if (count > reader.remaining() / HEADER_ENTRY_SIZE) {
        throw FormatError("malformed bundle: header table of " + std::to_string(count) +
                          " entries exceeds buffer");
    }

    Bundle bundle;
    bundle.headers_.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        const uint8_t* entry = reader.take(HEADER_ENTRY_SIZE, "header entry");
        BundleHeader header;
        std::copy(entry, entry + HEADER_ENTRY_SIZE, header.raw.begin());
        header.size = Serializer::read_le(entry, Serializer::WIDE_INT_SIZE);
        std::copy(entry + Serializer::WIDE_INT_SIZE, entry + HEADER_ENTRY_SIZE, header.id.begin());
        bundle.headers_.push_back(header);
    }

    for (size_t i = 0; i < bundle.headers_.size(); ++i) {
        const BundleHeader& header = bundle.headers_[i];
        if (header.size > reader.remaining()) {
            throw FormatError("malformed bundle: item " + std::to_string(i) + " runs past the end");
        }
        std::vector<uint8_t> slice = reader.take_bytes(static_cast<size_t>(header.size), "item");

        try {
            bundle.items_.push_back(DataItem::decode(slice));
        } catch (const LedgerError& e) {
            throw FormatError("malformed bundle: item " + std::to_string(i) + ": " + e.what());
        }
        if (bundle.items_.back().id() != header.id) {
            throw FormatError("malformed bundle: item " + std::to_string(i) + " id does not match header");
        }
    }

    if (reader.remaining() != 0) {
        throw FormatError("malformed bundle: " + std::to_string(reader.remaining()) + " trailing bytes");
    }

    bundle.raw_ = raw;
    return bundle;
}

bool Bundle::verify(const std::vector<uint8_t>& raw) {
    if (raw.size() < Serializer::WIDE_INT_SIZE) {
        return false;
    }
    // Wide fields whose value exceeds 64 bits cannot describe a buffer held in memory.
    auto fits_u64 = [](const uint8_t* field) {
        return std::all_of(field + 8, field + Serializer::WIDE_INT_SIZE, [](uint8_t b) { return b == 0; });
    };
    if (!fits_u64(raw.data())) {
        return false;
    }

    uint64_t count = Serializer::read_le(raw.data(), Serializer::WIDE_INT_SIZE);
    uint64_t available = raw.size() - Serializer::WIDE_INT_SIZE;
    if (count > available / HEADER_ENTRY_SIZE) {
        return false;
    }

    uint64_t expected = Serializer::WIDE_INT_SIZE + count * HEADER_ENTRY_SIZE;
    for (uint64_t i = 0; i < count; ++i) {
        const uint8_t* entry = raw.data() + Serializer::WIDE_INT_SIZE + i * HEADER_ENTRY_SIZE;
        if (!fits_u64(entry)) {
            return false;
        }
        uint64_t size = Serializer::read_le(entry, Serializer::WIDE_INT_SIZE);
        if (size > raw.size() - std::min<uint64_t>(expected, raw.size())) {
            return false;
        }
        expected += size;
    }
    return expected == raw.size();
}
