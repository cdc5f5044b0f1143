#include "cli/cli.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/signature.hpp"
#include "files/merkle.hpp"
#include "items/bundle.hpp"
#include "network/http_transport.hpp"
#include "network/uploader.hpp"
#include "tx/transaction.hpp"
#include <fstream>
#include <iterator>
#include <memory>

namespace {

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("cannot open " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string read_text(const std::string& path) {
    std::vector<uint8_t> bytes = read_file(path);
    return std::string(bytes.begin(), bytes.end());
}

std::unique_ptr<std::ofstream> open_output(const std::string& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!*file) {
        throw IOError("cannot create " + path);
    }
    return file;
}

void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    auto file = open_output(path);
    file->write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!*file) {
        throw IOError("failed writing " + path);
    }
}

uint64_t file_size(std::istream& in) {
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        throw IOError("cannot determine payload size");
    }
    in.seekg(0, std::ios::beg);
    return static_cast<uint64_t>(size);
}

} // namespace

CLI::CLI(std::vector<std::string> args, std::ostream& out)
    : args_(std::move(args)), out_(out), gateway_(GatewayConfig::from_url(DEFAULT_GATEWAY_URL)) {}

void CLI::print_help() {
    out_ << "Usage: weavepack [--gateway <url>] [--log <file>] [--verbose] <command> [args]\n"
         << "Commands:\n"
         << "  keygen --out <pem> [--type rsa|ed25519]     - Generate a signing key\n"
         << "  chunk <file>                                - Print chunks and data root\n"
         << "  item-create --key <pem> --in <file> --out <item>\n"
         << "      [--target <b64url>] [--anchor <b64url>] [--tag name=value]... [--stream]\n"
         << "                                              - Sign a data item\n"
         << "  item-verify <item>                          - Verify a data item\n"
         << "  bundle --out <file> <item>...               - Bundle signed data items\n"
         << "  bundle-verify <file>                        - Verify a bundle and its items\n"
         << "  tx-post --key <pem> --in <file> [--tag name=value]...\n"
         << "                                              - Sign and upload a transaction\n"
         << "  help                                        - Show this help\n";
}

CLI::Options CLI::parse_options(size_t first) const {
    Options options;
    for (size_t i = first; i < args_.size(); ++i) {
        const std::string& arg = args_[i];
        if (arg == "--stream") {
            options.stream = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= args_.size()) {
                throw LedgerError("missing value for " + arg);
            }
            const std::string& value = args_[++i];
            if (arg == "--tag") {
                size_t eq = value.find('=');
                if (eq == std::string::npos) {
                    throw LedgerError("tag must be name=value: " + value);
                }
                options.tags.push_back({value.substr(0, eq), value.substr(eq + 1)});
            } else {
                options.values[arg.substr(2)] = value;
            }
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

std::string CLI::require(const Options& options, const std::string& name) {
    auto it = options.values.find(name);
    if (it == options.values.end()) {
        throw LedgerError("missing --" + name);
    }
    return it->second;
}

int CLI::run() {
    size_t index = 0;
    while (index < args_.size() && args_[index].rfind("--", 0) == 0) {
        const std::string& flag = args_[index];
        if (flag == "--verbose") {
            Logger::instance().set_level(LogLevel::DEBUG);
            ++index;
        } else if ((flag == "--gateway" || flag == "--log") && index + 1 < args_.size()) {
            if (flag == "--gateway") {
                gateway_ = GatewayConfig::from_url(args_[index + 1]);
            } else {
                Logger::instance().init(args_[index + 1]);
            }
            index += 2;
        } else {
            out_ << "Unknown or incomplete option: " << flag << "\n";
            print_help();
            return 2;
        }
    }

    if (index >= args_.size()) {
        print_help();
        return 2;
    }

    const std::string& cmd = args_[index];
    Options options = parse_options(index + 1);

    if (cmd == "keygen") return cmd_keygen(options);
    if (cmd == "chunk") return cmd_chunk(options);
    if (cmd == "item-create") return cmd_item_create(options);
    if (cmd == "item-verify") return cmd_item_verify(options);
    if (cmd == "bundle") return cmd_bundle(options);
    if (cmd == "bundle-verify") return cmd_bundle_verify(options);
    if (cmd == "tx-post") return cmd_tx_post(options);
    if (cmd == "help") {
        print_help();
        return 0;
    }

    out_ << "Unknown command: " << cmd << "\n";
    print_help();
    return 2;
}

int CLI::cmd_keygen(const Options& options) {
    std::string path = require(options, "out");
    auto type = options.values.find("type");
    std::string kind = type == options.values.end() ? "rsa" : type->second;

    std::unique_ptr<Signer> signer;
    if (kind == "rsa") {
        signer = RsaPssSigner::generate();
    } else if (kind == "ed25519") {
        signer = Ed25519Signer::generate();
    } else {
        throw LedgerError("unknown key type: " + kind);
    }

    std::string pem = signer->private_key_pem();
    write_file(path, std::vector<uint8_t>(pem.begin(), pem.end()));
    out_ << "address: " << Signature::address_from_owner(signer->public_key()) << "\n";
    LOG_INFO("Wrote ", kind, " key to ", path);
    return 0;
}

int CLI::cmd_chunk(const Options& options) {
    if (options.positional.size() != 1) {
        throw LedgerError("chunk takes one file");
    }
    std::ifstream file(options.positional[0], std::ios::binary);
    if (!file) {
        throw IOError("cannot open " + options.positional[0]);
    }
    uint64_t size = file_size(file);
    Merkle::ChunkData chunks = Merkle::generate_transaction_chunks(file, size);

    out_ << "data_root: " << Base64::url_encode(chunks.data_root) << "\n";
    out_ << "data_size: " << size << "\n";
    for (size_t i = 0; i < chunks.chunks.size(); ++i) {
        const Chunk& chunk = chunks.chunks[i];
        out_ << "  chunk " << i << ": [" << chunk.min_byte_range << ", " << chunk.max_byte_range
             << ") " << Hasher::hash_to_hex(chunk.data_hash) << "\n";
    }
    return 0;
}

int CLI::cmd_item_create(const Options& options) {
    auto signer = Signature::load_signer(read_text(require(options, "key")));
    std::string in_path = require(options, "in");
    std::string out_path = require(options, "out");

    std::vector<uint8_t> target;
    std::vector<uint8_t> anchor;
    if (options.values.count("target")) {
        target = Base64::url_decode(options.values.at("target"));
    }
    if (options.values.count("anchor")) {
        anchor = Base64::url_decode(options.values.at("anchor"));
    }

    if (options.stream) {
        auto source = std::make_shared<std::ifstream>(in_path, std::ios::binary);
        if (!*source) {
            throw IOError("cannot open " + in_path);
        }
        uint64_t size = file_size(*source);
        DataItem item(source, size, target, anchor, options.tags);
        item.sign(*signer);
        auto out = open_output(out_path);
        item.write_raw_to(*out);
        out_ << "id: " << item.id_b64() << "\n";
    } else {
        DataItem item(read_file(in_path), target, anchor, options.tags);
        item.sign(*signer);
        write_file(out_path, item.get_raw_with_data());
        out_ << "id: " << item.id_b64() << "\n";
    }
    LOG_INFO("Wrote data item to ", out_path);
    return 0;
}

int CLI::cmd_item_verify(const Options& options) {
    if (options.positional.size() != 1) {
        throw LedgerError("item-verify takes one file");
    }
    DataItem item = DataItem::decode(read_file(options.positional[0]));
    item.verify();
    out_ << "valid: " << item.id_b64() << " (" << signature_meta(item.signature_type()).name
         << ", " << item.tags().size() << " tags, " << item.data_size() << " bytes)\n";
    return 0;
}

int CLI::cmd_bundle(const Options& options) {
    std::string out_path = require(options, "out");
    if (options.positional.empty()) {
        throw LedgerError("bundle needs at least one item");
    }

    std::vector<DataItem> items;
    for (const auto& path : options.positional) {
        items.push_back(DataItem::decode(read_file(path)));
    }
    auto out = open_output(out_path);
    Bundle::write_to(items, *out);
    out_ << "bundled " << items.size() << " items into " << out_path << "\n";
    LOG_INFO("Wrote bundle of ", items.size(), " items to ", out_path);
    return 0;
}

int CLI::cmd_bundle_verify(const Options& options) {
    if (options.positional.size() != 1) {
        throw LedgerError("bundle-verify takes one file");
    }
    std::vector<uint8_t> raw = read_file(options.positional[0]);
    if (!Bundle::verify(raw)) {
        out_ << "invalid: header table does not match bundle length\n";
        return 1;
    }

    Bundle bundle = Bundle::decode(raw);
    for (const auto& item : bundle.items()) {
        item.verify();
        out_ << "  " << item.id_b64() << " ok\n";
    }
    out_ << "valid: " << bundle.items().size() << " items\n";
    return 0;
}

int CLI::cmd_tx_post(const Options& options) {
    auto signer = Signature::load_signer(read_text(require(options, "key")));
    std::vector<uint8_t> data = read_file(require(options, "in"));

    HttpTransport transport(gateway_);
    GatewayClient client(transport);

    Transaction tx(data, {}, "0", options.tags);
    tx.set_last_tx(client.get_tx_anchor());
    tx.set_reward(client.get_price(data.size()));
    tx.sign(*signer);

    TransactionUploader uploader(client, tx, data);
    uploader.post_transaction();
    while (!uploader.is_complete()) {
        uploader.upload_chunk();
        out_ << "\r" << uploader.pct_complete() << "% (" << uploader.uploaded_chunks() << "/"
             << uploader.total_chunks() << ")" << std::flush;
    }
    out_ << "\nid: " << tx.id_b64() << "\n";
    return 0;
}
