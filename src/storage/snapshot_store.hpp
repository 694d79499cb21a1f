#pragma once

#include "skillmint/common.hpp"
#include "core/ledger/skill_ledger.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace skillmint::storage {

/**
 * SnapshotStore - Persists a LedgerSnapshot as a single JSON document
 *
 * Layout:
 *   { "version", "challenges", "proofs", "credentials", "auditLog",
 *     "escrow": { "accounts", "balances", "payouts", "nextSequence" },
 *     "indexes": { "challengesByCreator", "proofsBySolver", "credentialsByOwner" },
 *     "counters": { "nextChallengeId", "nextProofId", "nextTokenId" } }
 *
 * Indexes are written for readers of the file; on load they are checked
 * against the ones implied by the tables.
 */
class SnapshotStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit SnapshotStore(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }
    bool exists() const;

    /**
     * Write the snapshot (via a temporary file and rename)
     * @throws StorageException on I/O failure
     */
    void save(const ledger::LedgerSnapshot& snapshot) const;

    /**
     * Read the snapshot
     * @throws StorageException if missing, unreadable or inconsistent
     */
    ledger::LedgerSnapshot load() const;

    // Document conversion
    static nlohmann::json to_json(const ledger::LedgerSnapshot& snapshot);
    static ledger::LedgerSnapshot from_json(const nlohmann::json& document);

private:
    std::filesystem::path path_;
};

} // namespace skillmint::storage
