#pragma once

#include "skillmint/common.hpp"

namespace skillmint::crypto {

/**
 * Random number generation (CSPRNG)
 * Cryptographically secure random bytes
 */
class Random {
public:
    /**
     * Initialize libsodium. Safe to call more than once.
     * @return False if the library could not be initialized
     */
    static bool init();

    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     * @return Random bytes
     */
    static bytes generate(size_t size);
};

} // namespace skillmint::crypto
