#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// SkillMint Version
#define SKILLMINT_VERSION_MAJOR 0
#define SKILLMINT_VERSION_MINOR 1
#define SKILLMINT_VERSION_PATCH 0
#define SKILLMINT_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef SKILLMINT_PLATFORM_WINDOWS
        #define SKILLMINT_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef SKILLMINT_PLATFORM_LINUX
        #define SKILLMINT_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef SKILLMINT_PLATFORM_MACOS
        #define SKILLMINT_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define SKILLMINT_UNUSED(x) (void)(x)
#define SKILLMINT_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define SKILLMINT_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define SKILLMINT_DISALLOW_COPY_AND_MOVE(TypeName) \
    SKILLMINT_DISALLOW_COPY(TypeName); \
    SKILLMINT_DISALLOW_MOVE(TypeName)

// Constants
namespace skillmint {
namespace constants {

// Challenge constraints
constexpr uint8_t MIN_DIFFICULTY = 1;
constexpr uint8_t MAX_DIFFICULTY = 10;

// Proof constraints
constexpr uint32_t MAX_SCORE = 100;

// Credential constraints
constexpr uint8_t MIN_PROFICIENCY = 1;
constexpr uint8_t MAX_PROFICIENCY = 10;

// Account derivation
constexpr size_t ACCOUNT_ID_BYTES = 20;  // rendered as 0x + 40 hex chars

// Cryptography constants
constexpr size_t BLAKE3_HASH_SIZE = 32;
constexpr size_t COMMITMENT_SALT_SIZE = 32;

} // namespace constants
} // namespace skillmint

// Core types
namespace skillmint {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

// Cryptographic types
template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;

// Ledger handles: sequential, starting at 1. Zero means "none".
using ChallengeId = uint64_t;
using ProofId = uint64_t;
using TokenId = uint64_t;

constexpr uint64_t NO_ID = 0;

// Participants are opaque to the ledger
using ParticipantId = std::string;

// Reward and escrow units
using Amount = uint64_t;

/**
 * Normalize a skill/challenge type tag: trim ASCII whitespace and lowercase.
 * Tags are compared by their normalized form only.
 */
std::string normalize_tag(const std::string& tag);

} // namespace skillmint
