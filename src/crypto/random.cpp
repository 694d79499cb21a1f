#include "random.hpp"
#include "skillmint/error.hpp"
#include <sodium.h>

namespace skillmint::crypto {

bool Random::init() {
    // 0 on first success, 1 if already initialized
    return sodium_init() >= 0;
}

bytes Random::generate(size_t size) {
    if (!init()) {
        throw SkillmintException(ErrorCode::Unknown, "libsodium initialization failed");
    }
    bytes result(size);
    randombytes_buf(result.data(), size);
    return result;
}

} // namespace skillmint::crypto
