#include "sha1.h"

namespace kaddht {

static const uint32_t K[] = {
    0x5A827999, 0x6ED9EBA1, 0x8F1BBCDC, 0xCA62C1D6
};

static uint32_t left_rotate(uint32_t value, int amount) {
    return (value << amount) | (value >> (32 - amount));
}

Sha1::Sha1() : buffer_length_(0), total_length_(0), finalized_(false), result_{} {
    state_[0] = 0x67452301;
    state_[1] = 0xEFCDAB89;
    state_[2] = 0x98BADCFE;
    state_[3] = 0x10325476;
    state_[4] = 0xC3D2E1F0;
}

void Sha1::update(const uint8_t* data, size_t length) {
    if (finalized_) {
        return;
    }
    for (size_t i = 0; i < length; i++) {
        buffer_[buffer_length_++] = data[i];
        if (buffer_length_ == 64) {
            process_block();
            buffer_length_ = 0;
        }
    }
    total_length_ += length;
}

void Sha1::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void Sha1::process_block() {
    uint32_t w[80];

    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(buffer_[i * 4]) << 24) |
               (static_cast<uint32_t>(buffer_[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(buffer_[i * 4 + 2]) << 8) |
               (static_cast<uint32_t>(buffer_[i * 4 + 3]));
    }
    for (int i = 16; i < 80; i++) {
        w[i] = left_rotate(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];
    uint32_t e = state_[4];

    for (int i = 0; i < 80; i++) {
        uint32_t f, k;
        if (i < 20) {
            f = (b & c) | (~b & d);
            k = K[0];
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = K[1];
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = K[2];
        } else {
            f = b ^ c ^ d;
            k = K[3];
        }

        uint32_t temp = left_rotate(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = left_rotate(b, 30);
        b = a;
        a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

Sha1Digest Sha1::digest() {
    if (finalized_) {
        return result_;
    }

    uint64_t bit_length = total_length_ * 8;

    uint8_t padding[72] = {0x80};
    size_t pad_length = (buffer_length_ < 56) ? (56 - buffer_length_) : (120 - buffer_length_);
    for (int i = 0; i < 8; i++) {
        padding[pad_length + i] = static_cast<uint8_t>(bit_length >> ((7 - i) * 8));
    }
    update(padding, pad_length + 8);
    finalized_ = true;

    for (int i = 0; i < 5; i++) {
        result_[i * 4]     = static_cast<uint8_t>(state_[i] >> 24);
        result_[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
        result_[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
        result_[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return result_;
}

Sha1Digest Sha1::hash(const std::string& input) {
    Sha1 hasher;
    hasher.update(input);
    return hasher.digest();
}

} // namespace kaddht
