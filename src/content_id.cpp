#include "content_id.h"
#include "types.h"

namespace kaddht {

namespace {

constexpr size_t MAX_VARINT_LEN = 9;
constexpr size_t CIDV0_LEN = 34;

} // namespace

bool read_uvarint(const std::string& data, size_t& pos, uint64_t& value) {
    uint64_t result = 0;
    unsigned shift = 0;
    for (size_t i = 0; i < MAX_VARINT_LEN; ++i) {
        if (pos + i >= data.size()) {
            return false;
        }
        uint8_t byte = static_cast<uint8_t>(data[pos + i]);
        result |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            // A trailing zero byte means the encoding was not minimal
            if (byte == 0 && i > 0) {
                return false;
            }
            pos += i + 1;
            value = result;
            return true;
        }
        shift += 7;
    }
    return false;
}

void append_uvarint(std::string& out, uint64_t value) {
    while (value >= 0x80) {
        out += static_cast<char>((value & 0x7F) | 0x80);
        value >>= 7;
    }
    out += static_cast<char>(value);
}

std::optional<ContentId> ContentId::parse(const std::string& bytes) {
    ContentId cid;
    cid.bytes_ = bytes;

    if (bytes.size() == CIDV0_LEN &&
        static_cast<uint8_t>(bytes[0]) == MULTIHASH_SHA2_256 &&
        static_cast<uint8_t>(bytes[1]) == 32) {
        cid.version_ = 0;
        cid.codec_ = CODEC_DAG_PB;
        cid.hash_code_ = MULTIHASH_SHA2_256;
        cid.digest_ = bytes.substr(2);
        return cid;
    }

    size_t pos = 0;
    uint64_t version = 0;
    if (!read_uvarint(bytes, pos, version) || version != 1) {
        return std::nullopt;
    }

    uint64_t codec = 0;
    uint64_t hash_code = 0;
    uint64_t digest_len = 0;
    if (!read_uvarint(bytes, pos, codec) ||
        !read_uvarint(bytes, pos, hash_code) ||
        !read_uvarint(bytes, pos, digest_len)) {
        return std::nullopt;
    }

    if (digest_len != bytes.size() - pos) {
        return std::nullopt;
    }

    cid.version_ = version;
    cid.codec_ = codec;
    cid.hash_code_ = hash_code;
    cid.digest_ = bytes.substr(pos);
    return cid;
}

std::string ContentId::to_hex() const {
    return kaddht::to_hex(bytes_);
}

} // namespace kaddht
