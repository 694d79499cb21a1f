#pragma once

#include "skillmint/common.hpp"
#include <memory>
#include <optional>
#include <string>

namespace skillmint::crypto {

/**
 * BLAKE3 cryptographic hash function wrapper
 */
class Blake3 {
public:
    /**
     * Hash data using BLAKE3
     * @param data The data to hash
     * @return 32-byte hash
     */
    static Hash256 hash(const bytes& data);

    /**
     * Hash a string using BLAKE3
     */
    static Hash256 hash(const std::string& str);

    /**
     * Convert hash to hex string
     */
    static std::string hash_to_hex(const Hash256& hash);

    /**
     * Parse hash from hex string
     */
    static std::optional<Hash256> hash_from_hex(const std::string& hex);
};

/**
 * Incremental BLAKE3 hasher for multi-field digests.
 * Each field is length-prefixed so that adjacent fields cannot alias.
 */
class Blake3Hasher {
public:
    Blake3Hasher();
    ~Blake3Hasher();

    Blake3Hasher(const Blake3Hasher&) = delete;
    Blake3Hasher& operator=(const Blake3Hasher&) = delete;

    Blake3Hasher& update(const std::string& field);
    Blake3Hasher& update(uint64_t field);
    Blake3Hasher& update(const bytes& field);

    Hash256 finalize() const;

private:
    struct State;
    std::unique_ptr<State> state_;
};

} // namespace skillmint::crypto
