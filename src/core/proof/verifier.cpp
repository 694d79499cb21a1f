#include "core/proof/verifier.hpp"
#include "crypto/blake3.hpp"
#include "crypto/random.hpp"
#include <algorithm>

namespace skillmint::core {

bool NonEmptyVerifier::verify(const std::string& external_proof) {
    std::string body = external_proof;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }
    if (body.empty()) {
        return false;
    }
    return std::any_of(body.begin(), body.end(), [](char c) { return c != '0'; });
}

bool CommitmentVerifier::verify(const std::string& external_proof) {
    if (external_proof.size() != constants::BLAKE3_HASH_SIZE * 2) {
        return false;
    }
    return std::all_of(external_proof.begin(), external_proof.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string CommitmentVerifier::issue(const std::string& solution_digest,
                                      const std::string& challenge_digest) {
    auto salt = crypto::Random::generate(constants::COMMITMENT_SALT_SIZE);

    crypto::Blake3Hasher hasher;
    hasher.update(solution_digest)
          .update(challenge_digest)
          .update(salt);
    return crypto::Blake3::hash_to_hex(hasher.finalize());
}

std::unique_ptr<ProofVerifier> make_verifier(const std::string& name) {
    if (name == "non_empty") {
        return std::make_unique<NonEmptyVerifier>();
    }
    if (name == "commitment") {
        return std::make_unique<CommitmentVerifier>();
    }
    return nullptr;
}

} // namespace skillmint::core
