#pragma once

#include "skillmint/common.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace skillmint::core {

/**
 * ProofVerifier - External proof oracle
 *
 * The ledger treats the verdict as opaque. Implementations must not
 * depend on ledger state; verify() is called outside every ledger lock
 * and may block.
 */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    /**
     * @param external_proof Opaque token submitted with the proof
     * @return True if the proof is valid
     */
    virtual bool verify(const std::string& external_proof) = 0;

    virtual const char* name() const = 0;
};

/**
 * NonEmptyVerifier - Accepts any token that is non-empty and not all zeros
 * (an optional 0x prefix is ignored).
 */
class NonEmptyVerifier : public ProofVerifier {
public:
    bool verify(const std::string& external_proof) override;
    const char* name() const override { return "non_empty"; }
};

/**
 * CommitmentVerifier - Issues and checks 64-hex BLAKE3 commitments
 *
 * Tokens are a digest over the solution commitment, the challenge
 * commitment and a random salt. Verification accepts any well-formed
 * lowercase 64-hex token; it does not re-derive the commitment.
 */
class CommitmentVerifier : public ProofVerifier {
public:
    bool verify(const std::string& external_proof) override;
    const char* name() const override { return "commitment"; }

    /**
     * Produce a proof token for a solution to a challenge
     */
    static std::string issue(const std::string& solution_digest,
                             const std::string& challenge_digest);
};

/**
 * CallbackVerifier - Delegates to a callable
 */
class CallbackVerifier : public ProofVerifier {
public:
    using Callback = std::function<bool(const std::string&)>;

    explicit CallbackVerifier(Callback callback) : callback_(std::move(callback)) {}

    bool verify(const std::string& external_proof) override { return callback_(external_proof); }
    const char* name() const override { return "callback"; }

private:
    Callback callback_;
};

/**
 * Build a verifier by its configured name ("non_empty" or "commitment")
 */
std::unique_ptr<ProofVerifier> make_verifier(const std::string& name);

} // namespace skillmint::core
