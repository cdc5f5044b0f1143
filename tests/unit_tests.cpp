#include "gtest/gtest.h"
#include "crypto/hasher.hpp"
#include "crypto/deep_hash.hpp"
#include "crypto/signature.hpp"
#include "common/base64.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/serializer.hpp"
#include "files/chunker.hpp"
#include "files/merkle.hpp"
#include "network/http_transport.hpp"
#include "test_helpers.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

std::string deep_hash_hex(const DeepHashItem& item) {
    return Hasher::hash_to_hex(DeepHash::hash(item));
}

} // namespace

// Test Hasher::sha256(const std::vector<uint8_t>&)
TEST(HasherTest, Sha256Vector) {
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    hash_t expected_hash = Hasher::hex_to_hash("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_EQ(Hasher::sha256(data), expected_hash);
}

// Test Hasher::sha256(const std::string&)
TEST(HasherTest, Sha256String) {
    std::string data = "Hello, World!";
    hash_t expected_hash = Hasher::hex_to_hash("dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
    ASSERT_EQ(Hasher::sha256(data), expected_hash);
}

TEST(HasherTest, Sha384String) {
    ASSERT_EQ(Hasher::hash_to_hex(Hasher::sha384(std::string("abc"))),
              "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
              "8086072ba1e7cc2358baeca134c825a7");
}

// Test Hasher::hex_to_hash and Hasher::hash_to_hex
TEST(HasherTest, HexConversion) {
    std::string hex_str = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    hash_t hash = Hasher::hex_to_hash(hex_str);
    ASSERT_EQ(Hasher::hash_to_hex(hash), hex_str);
}

TEST(HasherTest, HexToHashRejectsNonHex) {
    std::string bad(64, 'a');
    bad[10] = 'g';
    ASSERT_THROW(Hasher::hex_to_hash(bad), FormatError);
    ASSERT_THROW(Hasher::hex_to_hash(std::string(62, '0') + "-1"), FormatError);
    ASSERT_THROW(Hasher::hex_to_hash("abcd"), FormatError);
}

TEST(HasherTest, StreamedDigestMatchesOneShot) {
    std::vector<uint8_t> data = pattern_payload(200000);
    std::string text(data.begin(), data.end());
    std::istringstream in(text);

    Hasher::Digest digest(Hasher::Digest::Algorithm::SHA256);
    digest.update(in, data.size());
    hash_t one_shot = Hasher::sha256(data);
    ASSERT_EQ(digest.finalize(), std::vector<uint8_t>(one_shot.begin(), one_shot.end()));
}

TEST(HasherTest, StreamedDigestShortStreamThrows) {
    std::istringstream in("only a few bytes");
    Hasher::Digest digest(Hasher::Digest::Algorithm::SHA384);
    ASSERT_THROW(digest.update(in, 1000), IOError);
}

TEST(Base64Test, UrlAlphabetWithoutPadding) {
    std::vector<uint8_t> data = {0xfb, 0xff, 0xfe};
    ASSERT_EQ(Base64::url_encode(data), "-__-");
    ASSERT_EQ(Base64::url_encode(std::vector<uint8_t>{'a'}), "YQ");
    ASSERT_EQ(Base64::url_decode("YQ"), std::vector<uint8_t>{'a'});
    ASSERT_EQ(Base64::url_decode("-__-"), data);
    ASSERT_TRUE(Base64::url_decode("").empty());
}

TEST(Base64Test, RejectsMalformedInput) {
    ASSERT_THROW(Base64::url_decode("ab+c"), FormatError);
    ASSERT_THROW(Base64::url_decode("abcde"), FormatError);
    ASSERT_THROW(Base64::url_decode("ab*d"), FormatError);
}

TEST(SerializerTest, LittleEndianWideIntegers) {
    std::vector<uint8_t> buffer;
    Serializer::append_le(buffer, 0x0102, Serializer::WIDE_INT_SIZE);
    ASSERT_EQ(buffer.size(), Serializer::WIDE_INT_SIZE);
    ASSERT_EQ(buffer[0], 0x02);
    ASSERT_EQ(buffer[1], 0x01);
    ASSERT_EQ(Serializer::read_le(buffer.data(), buffer.size()), 0x0102u);

    buffer[20] = 1;
    ASSERT_THROW(Serializer::read_le(buffer.data(), buffer.size()), FormatError);
}

TEST(SerializerTest, NotesAreBigEndian) {
    std::vector<uint8_t> note = Serializer::encode_note(0x0102);
    ASSERT_EQ(note.size(), 32u);
    ASSERT_EQ(note[30], 0x01);
    ASSERT_EQ(note[31], 0x02);

    uint64_t value = 0;
    ASSERT_TRUE(Serializer::decode_note(note.data(), value));
    ASSERT_EQ(value, 0x0102u);

    note[0] = 0xff;
    ASSERT_FALSE(Serializer::decode_note(note.data(), value));
}

TEST(SerializerTest, ByteReaderBoundsChecks) {
    std::vector<uint8_t> data = {1, 2, 3};
    Serializer::ByteReader reader(data);
    ASSERT_EQ(reader.take_u8("first"), 1);
    ASSERT_EQ(reader.remaining(), 2u);
    ASSERT_THROW(reader.take(3, "too much"), FormatError);
    ASSERT_EQ(reader.take_le(2, "pair"), 0x0302u);
    ASSERT_THROW(reader.take_u8("past end"), FormatError);
}

TEST(DeepHashTest, BlobVector) {
    ASSERT_EQ(deep_hash_hex(DeepHashItem::blob(std::string("abc"))),
              "71115a30152ebcffb6defbb643abc8ef76f01fe323f1d62340646085960f6e34"
              "7cb2d8e9a46ddee655b3012c6131d4e0");
}

TEST(DeepHashTest, NestedListVector) {
    DeepHashItem item = DeepHashItem::list({
        DeepHashItem::blob(std::string("a")),
        DeepHashItem::list({DeepHashItem::blob(std::string("b")), DeepHashItem::blob(std::string(""))}),
        DeepHashItem::blob(std::string("hello world")),
    });
    ASSERT_EQ(deep_hash_hex(item),
              "24af5a87fa2aeb02e585d732d91abafd00dc82972ad5c22264ff061d6519695c"
              "d3d9e48a770881f220d025e9aa866540");
}

TEST(DeepHashTest, EmptyListVector) {
    ASSERT_EQ(deep_hash_hex(DeepHashItem::list({})),
              "a69e7d37fdc7f040a9ec16aae84de24fab4a653dac4de0bd247e36bab9fe45d9"
              "289c5a04a893c95285812f5cefc9707a");
}

TEST(DeepHashTest, StreamedTailMatchesInMemory) {
    std::vector<uint8_t> tail = pattern_payload(70000);
    DeepHashItem::List head = {DeepHashItem::blob(std::string("dataitem")), DeepHashItem::blob(std::string("1"))};

    DeepHashItem::List full = head;
    full.push_back(DeepHashItem::blob(tail));

    std::istringstream in(std::string(tail.begin(), tail.end()));
    ASSERT_EQ(DeepHash::hash_list_with_stream(head, in, tail.size()), DeepHash::hash(DeepHashItem::list(full)));

    std::istringstream blob_in(std::string(tail.begin(), tail.end()));
    ASSERT_EQ(DeepHash::hash_blob_stream(blob_in, tail.size()), DeepHash::hash(DeepHashItem::blob(tail)));
}

TEST(DeepHashTest, ShortStreamThrows) {
    std::istringstream in("short");
    ASSERT_THROW(DeepHash::hash_blob_stream(in, 64), IOError);
}

TEST(ChunkerTest, EmptyPayloadYieldsOneEmptyChunk) {
    auto chunks = Chunker::chunk_data({});
    ASSERT_EQ(chunks.size(), 1u);
    ASSERT_EQ(chunks[0].min_byte_range, 0u);
    ASSERT_EQ(chunks[0].max_byte_range, 0u);
}

TEST(ChunkerTest, ChunksCoverPayloadContiguously) {
    std::vector<uint8_t> data = pattern_payload(600000);
    auto chunks = Chunker::chunk_data(data);
    ASSERT_EQ(chunks.size(), 3u);

    uint64_t expected_start = 0;
    for (const auto& chunk : chunks) {
        ASSERT_EQ(chunk.min_byte_range, expected_start);
        ASSERT_LE(chunk.size(), Chunker::MAX_CHUNK_SIZE);
        ASSERT_EQ(chunk.data_hash, Hasher::sha256(data.data() + chunk.min_byte_range, chunk.size()));
        expected_start = chunk.max_byte_range;
    }
    ASSERT_EQ(expected_start, data.size());
    ASSERT_EQ(chunks[1].max_byte_range, 524288u);
}

TEST(ChunkerTest, SmallTailIsBalanced) {
    // MAX + 1000 would leave a 1000-byte tail, so the remainder is halved instead.
    auto chunks = Chunker::chunk_data(pattern_payload(263144));
    ASSERT_EQ(chunks.size(), 2u);
    ASSERT_EQ(chunks[0].size(), 131572u);
    ASSERT_EQ(chunks[1].size(), 131572u);
    ASSERT_GE(chunks[1].size(), Chunker::MIN_CHUNK_SIZE);
}

TEST(ChunkerTest, ExactMultipleEndsWithEmptyChunk) {
    auto chunks = Chunker::chunk_data(pattern_payload(524288));
    ASSERT_EQ(chunks.size(), 3u);
    ASSERT_EQ(chunks[2].size(), 0u);
    ASSERT_EQ(chunks[2].min_byte_range, 524288u);
}

TEST(ChunkerTest, StreamMatchesBuffer) {
    std::vector<uint8_t> data = pattern_payload(600000);
    std::istringstream in(std::string(data.begin(), data.end()));
    auto streamed = Chunker::chunk_stream(in, data.size());
    auto buffered = Chunker::chunk_data(data);

    ASSERT_EQ(streamed.size(), buffered.size());
    for (size_t i = 0; i < streamed.size(); ++i) {
        ASSERT_EQ(streamed[i].data_hash, buffered[i].data_hash);
        ASSERT_EQ(streamed[i].min_byte_range, buffered[i].min_byte_range);
        ASSERT_EQ(streamed[i].max_byte_range, buffered[i].max_byte_range);
    }
}

TEST(ChunkerTest, StreamEndingEarlyThrows) {
    std::istringstream in(std::string(1000, 'x'));
    ASSERT_THROW(Chunker::chunk_stream(in, 5000), IOError);
}

TEST(MerkleTest, RegressionRoots) {
    struct Fixture { size_t size; const char* root; };
    const Fixture fixtures[] = {
        {0, "x9bUbvLyiRlsOOqClNkKV0LAohFd-PfXfb_XoYosfQI"},
        {1, "JIK3SDDlKjjt_JzGUajGEVDAYS2klcOz3BwUxUeqql4"},
        {262144, "9caFXo8ZSLO0FkhNX--ThqiAjqDnmbHqI0OoDvCidIA"},
        {263144, "UfwGZ21aQ9pU6c1Mz_5Cwvrfty407t2yQ4qF6kvZcaw"},
        {524288, "Jp4EJ4ivkK4uaFAyO7jdOl9l5CBJ5WjljFzziUgIaCw"},
        {600000, "n67Nefiqy059Y1xdQvDmf8uxgsuAtHDdNnBE3riX52M"},
        {1048576, "MKkvbStBoAXo8S_MMkCN8oJS3wndK21rrfqHwt7qNK8"},
    };
    for (const auto& fixture : fixtures) {
        auto root = Merkle::generate_tree(pattern_payload(fixture.size));
        EXPECT_EQ(Base64::url_encode(root->id), fixture.root) << "size " << fixture.size;
    }
}

TEST(MerkleTest, TransactionChunksDropTrailingEmptyChunk) {
    auto chunk_data = Merkle::generate_transaction_chunks(pattern_payload(262144));
    ASSERT_EQ(chunk_data.chunks.size(), 1u);
    ASSERT_EQ(chunk_data.proofs.size(), 1u);
    ASSERT_EQ(Base64::url_encode(chunk_data.data_root), "9caFXo8ZSLO0FkhNX--ThqiAjqDnmbHqI0OoDvCidIA");
}

TEST(MerkleTest, FirstProofMatchesFixture) {
    auto chunk_data = Merkle::generate_transaction_chunks(pattern_payload(600000));
    ASSERT_EQ(Hasher::hash_to_hex(chunk_data.data_root),
              "9faecd79f8aacb4e7d635c5d42f0e67fcbb182cb80b470dd367044deb897e763");
    ASSERT_EQ(chunk_data.proofs.size(), 3u);
    ASSERT_EQ(chunk_data.proofs[0].offset, 262143u);
    ASSERT_EQ(chunk_data.proofs[0].proof.size(), 256u);
    ASSERT_EQ(Base64::url_encode(chunk_data.proofs[0].proof),
              "ug7xA8cdar4oOril4rCJMP-UUmP0mPyl4E360sS0bhv7PJC0ajYHvRzk5XG72nQMls4el1TJOzQVUM1BFiC0NAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAACAAA"
              "-_35VbWdB68k-dAwS4BXbop-toPyGVv0Tv7yldYvSMc-JWDAgR6645sK3Z4l5czg_ffYgLRdLZuvFgfZpdXYVwAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAABAAA"
              "0w6yQflefDfAMyUaeOrhYQrJsC3JliVEIVgYDTWBjBsAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAQAAA");
}

TEST(MerkleTest, StreamedChunksMatchBuffered) {
    std::vector<uint8_t> data = pattern_payload(600000);
    std::istringstream in(std::string(data.begin(), data.end()));
    auto streamed = Merkle::generate_transaction_chunks(in, data.size());
    auto buffered = Merkle::generate_transaction_chunks(data);
    ASSERT_EQ(streamed.data_root, buffered.data_root);
    ASSERT_EQ(streamed.proofs.size(), buffered.proofs.size());
    for (size_t i = 0; i < streamed.proofs.size(); ++i) {
        ASSERT_EQ(streamed.proofs[i].proof, buffered.proofs[i].proof);
    }
}

TEST(MerkleTest, EveryProofValidates) {
    std::vector<uint8_t> data = pattern_payload(1048576 + 12345);
    auto chunk_data = Merkle::generate_transaction_chunks(data);
    ASSERT_GT(chunk_data.chunks.size(), 1u);

    for (size_t i = 0; i < chunk_data.chunks.size(); ++i) {
        const Chunk& chunk = chunk_data.chunks[i];
        auto result = Merkle::validate_path(chunk_data.data_root, chunk_data.proofs[i].offset, 0,
                                            data.size(), chunk_data.proofs[i].proof);
        EXPECT_EQ(result.left_bound, chunk.min_byte_range);
        EXPECT_EQ(result.right_bound, chunk.max_byte_range);
        EXPECT_EQ(result.chunk_size, chunk.size());
        EXPECT_EQ(result.offset, chunk.max_byte_range - 1);
    }
}

TEST(MerkleTest, DestinationPastEndIsClamped) {
    std::vector<uint8_t> data = pattern_payload(600000);
    auto chunk_data = Merkle::generate_transaction_chunks(data);
    auto result = Merkle::validate_path(chunk_data.data_root, data.size(), 0, data.size(),
                                        chunk_data.proofs[0].proof);
    ASSERT_EQ(result.left_bound, 0u);
    ASSERT_EQ(result.right_bound, 262144u);
}

TEST(MerkleTest, TamperedProofIsRejected) {
    std::vector<uint8_t> data = pattern_payload(600000);
    auto chunk_data = Merkle::generate_transaction_chunks(data);
    const auto& proof = chunk_data.proofs[1];

    std::vector<uint8_t> tampered = proof.proof;
    tampered[5] ^= 0x01;
    ASSERT_THROW(Merkle::validate_path(chunk_data.data_root, proof.offset, 0, data.size(), tampered),
                 InvalidProof);

    hash_t wrong_root = chunk_data.data_root;
    wrong_root[0] ^= 0x80;
    ASSERT_THROW(Merkle::validate_path(wrong_root, proof.offset, 0, data.size(), proof.proof), InvalidProof);

    std::vector<uint8_t> truncated(proof.proof.begin(), proof.proof.end() - 10);
    ASSERT_THROW(Merkle::validate_path(chunk_data.data_root, proof.offset, 0, data.size(), truncated),
                 InvalidProof);

    ASSERT_THROW(Merkle::validate_path(chunk_data.data_root, 0, 0, 0, proof.proof), InvalidProof);
}

TEST(MerkleTest, EmptyLeafListIsRejected) {
    ASSERT_THROW(Merkle::build_layers({}), FormatError);
}

TEST(SignatureTest, MetaTable) {
    ASSERT_EQ(signature_meta(1).signature_length, 512u);
    ASSERT_EQ(signature_meta(2).public_key_length, 32u);
    ASSERT_EQ(signature_meta(3).signature_length, 65u);
    ASSERT_EQ(signature_meta(4).signature_length, 64u);
    ASSERT_THROW(signature_meta(99), UnsupportedSignatureType);
}

TEST(SignatureTest, RsaSignVerify) {
    const Signer& signer = shared_rsa_signer();
    std::vector<uint8_t> message = {'H', 'e', 'l', 'l', 'o'};
    std::vector<uint8_t> signature = signer.sign(message);

    ASSERT_EQ(signature.size(), 512u);
    ASSERT_EQ(signer.public_key().size(), 512u);
    ASSERT_TRUE(Signature::verify(1, message, signature, signer.public_key()));

    message[0] = 'J';
    ASSERT_FALSE(Signature::verify(1, message, signature, signer.public_key()));
}

TEST(SignatureTest, Ed25519SignVerifyAndPemRoundTrip) {
    const Signer& signer = shared_ed25519_signer();
    std::vector<uint8_t> message(48, 0x42);
    std::vector<uint8_t> signature = signer.sign(message);
    ASSERT_TRUE(Signature::verify(2, message, signature, signer.public_key()));
    ASSERT_TRUE(Signature::verify(4, message, signature, signer.public_key()));

    auto reloaded = Signature::load_signer(signer.private_key_pem());
    ASSERT_EQ(reloaded->signature_type(), 2);
    ASSERT_EQ(reloaded->public_key(), signer.public_key());
}

TEST(SignatureTest, UnusableRsaOwnerFailsVerification) {
    std::vector<uint8_t> message(48, 0);
    std::vector<uint8_t> signature(512, 0x01);
    bool verified = true;
    ASSERT_NO_THROW(verified = Signature::verify(1, message, signature, std::vector<uint8_t>(512, 0)));
    ASSERT_FALSE(verified);
}

TEST(SignatureTest, WrongShapeOwnerFailsVerification) {
    std::vector<uint8_t> message(48, 0);
    ASSERT_FALSE(Signature::verify(2, message, std::vector<uint8_t>(64, 0), std::vector<uint8_t>(31, 0)));
    ASSERT_THROW(Signature::verify(3, message, std::vector<uint8_t>(65, 0), std::vector<uint8_t>(65, 0)),
                 UnsupportedSignatureType);
}

TEST(ConfigTest, ParsesGatewayUrls) {
    GatewayConfig https = GatewayConfig::from_url("https://arweave.net");
    ASSERT_TRUE(https.use_tls());
    ASSERT_EQ(https.host, "arweave.net");
    ASSERT_EQ(https.port, 443);
    ASSERT_EQ(https.url(), "https://arweave.net");

    GatewayConfig local = GatewayConfig::from_url("http://localhost:1984/");
    ASSERT_FALSE(local.use_tls());
    ASSERT_EQ(local.host, "localhost");
    ASSERT_EQ(local.port, 1984);
    ASSERT_EQ(local.url(), "http://localhost:1984");

    ASSERT_THROW(GatewayConfig::from_url("ftp://example.com"), LedgerError);
    ASSERT_THROW(GatewayConfig::from_url("arweave.net"), LedgerError);
    ASSERT_THROW(GatewayConfig::from_url("http://host:99999"), LedgerError);
}

TEST(HttpTransportTest, ParsesContentLengthResponse) {
    HttpResponse response = HttpTransport::parse_response(
        "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\n12345");
    ASSERT_EQ(response.status, 200);
    ASSERT_EQ(response.body, "12345");
    ASSERT_TRUE(response.ok());
}

TEST(HttpTransportTest, ParsesChunkedResponse) {
    HttpResponse response = HttpTransport::parse_response(
        "HTTP/1.1 400 Bad Request\r\nTransfer-Encoding: chunked\r\n\r\n"
        "7\r\ninvalid\r\n5\r\n_data\r\n0\r\n\r\n");
    ASSERT_EQ(response.status, 400);
    ASSERT_EQ(response.body, "invalid_data");
    ASSERT_FALSE(response.ok());
}

TEST(HttpTransportTest, RejectsGarbage) {
    ASSERT_THROW(HttpTransport::parse_response("not http at all"), NetworkError);
    ASSERT_THROW(HttpTransport::parse_response("SMTP 200\r\n\r\n"), NetworkError);
}
