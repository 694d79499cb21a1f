#include "blake3.hpp"
#include <blake3.h>
#include <sstream>
#include <iomanip>

namespace skillmint::crypto {

namespace {
    std::string bytes_to_hex(const byte* data, size_t len) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool hex_to_bytes(const std::string& hex, byte* out, size_t out_len) {
        if (hex.length() != out_len * 2) return false;

        for (size_t i = 0; i < out_len; ++i) {
            int hi = hex_value(hex[i * 2]);
            int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out[i] = static_cast<byte>((hi << 4) | lo);
        }
        return true;
    }

    void encode_u64(uint64_t value, byte* out) {
        for (int i = 0; i < 8; ++i) {
            out[i] = static_cast<byte>(value >> (i * 8));
        }
    }
}

Hash256 Blake3::hash(const bytes& data) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::hash(const std::string& str) {
    bytes data(str.begin(), str.end());
    return hash(data);
}

std::string Blake3::hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

std::optional<Hash256> Blake3::hash_from_hex(const std::string& hex) {
    Hash256 hash;
    if (!hex_to_bytes(hex, hash.data(), hash.size())) {
        return std::nullopt;
    }
    return hash;
}

// Blake3Hasher

struct Blake3Hasher::State {
    blake3_hasher hasher;
};

Blake3Hasher::Blake3Hasher()
    : state_(std::make_unique<State>())
{
    blake3_hasher_init(&state_->hasher);
}

Blake3Hasher::~Blake3Hasher() = default;

Blake3Hasher& Blake3Hasher::update(const std::string& field) {
    byte len[8];
    encode_u64(field.size(), len);
    blake3_hasher_update(&state_->hasher, len, sizeof(len));
    blake3_hasher_update(&state_->hasher, field.data(), field.size());
    return *this;
}

Blake3Hasher& Blake3Hasher::update(uint64_t field) {
    byte value[8];
    encode_u64(field, value);
    blake3_hasher_update(&state_->hasher, value, sizeof(value));
    return *this;
}

Blake3Hasher& Blake3Hasher::update(const bytes& field) {
    byte len[8];
    encode_u64(field.size(), len);
    blake3_hasher_update(&state_->hasher, len, sizeof(len));
    blake3_hasher_update(&state_->hasher, field.data(), field.size());
    return *this;
}

Hash256 Blake3Hasher::finalize() const {
    Hash256 result;
    blake3_hasher_finalize(&state_->hasher, result.data(), result.size());
    return result;
}

} // namespace skillmint::crypto
