#include "storage/snapshot_store.hpp"
#include "skillmint/error.hpp"
#include "utils/logger.hpp"
#include <cstdint>
#include <fstream>
#include <map>
#include <set>

namespace skillmint::storage {

using json = nlohmann::json;

namespace {

    // Index conversion

    template<typename Records, typename KeyFn>
    std::map<ParticipantId, std::vector<uint64_t>> build_index(const Records& records, KeyFn key_of) {
        // Records are exported in ascending id order, which is insertion order
        std::map<ParticipantId, std::vector<uint64_t>> index;
        for (const auto& record : records) {
            auto [participant, id] = key_of(record);
            index[participant].push_back(id);
        }
        return index;
    }

    json index_to_json(const std::map<ParticipantId, std::vector<uint64_t>>& index) {
        json result = json::object();
        for (const auto& [participant, ids] : index) {
            result[participant] = ids;
        }
        return result;
    }

    std::map<ParticipantId, std::vector<uint64_t>> index_from_json(const json& value) {
        std::map<ParticipantId, std::vector<uint64_t>> index;
        for (auto it = value.begin(); it != value.end(); ++it) {
            index[it.key()] = it.value().get<std::vector<uint64_t>>();
        }
        return index;
    }

    [[noreturn]] void corrupted(const std::string& message) {
        throw StorageException(ErrorCode::StorageCorrupted, message);
    }

    // Narrow fields are read at full width and range-checked before narrowing
    template<typename T>
    T read_bounded(const json& j, const char* key, uint64_t min, uint64_t max,
                   const std::string& record) {
        auto value = j.at(key).get<uint64_t>();
        if (value < min || value > max) {
            corrupted(record + " has " + key + " out of range: " + std::to_string(value));
        }
        return static_cast<T>(value);
    }

    // Record conversion

    json challenge_to_json(const core::Challenge& c) {
        return json{
            {"id", c.id},
            {"type", c.challenge_type},
            {"difficulty", c.difficulty},
            {"timeLimit", c.time_limit},
            {"rewardAmount", c.reward_amount},
            {"active", c.active},
            {"creator", c.creator},
            {"contentDigest", c.content_digest},
            {"createdAt", c.created_at}
        };
    }

    core::Challenge challenge_from_json(const json& j) {
        core::Challenge c;
        c.id = j.at("id").get<ChallengeId>();
        c.challenge_type = j.at("type").get<std::string>();
        c.time_limit = j.at("timeLimit").get<uint64_t>();
        c.reward_amount = j.at("rewardAmount").get<Amount>();
        c.active = j.at("active").get<bool>();
        c.creator = j.at("creator").get<ParticipantId>();
        c.content_digest = j.at("contentDigest").get<std::string>();
        c.created_at = j.at("createdAt").get<uint64_t>();

        if (c.id == NO_ID) {
            corrupted("challenge with id 0");
        }
        c.difficulty = read_bounded<uint8_t>(j, "difficulty",
            constants::MIN_DIFFICULTY, constants::MAX_DIFFICULTY, "challenge " + std::to_string(c.id));
        if (c.time_limit == 0) {
            corrupted("challenge " + std::to_string(c.id) + " has a zero time limit");
        }
        return c;
    }

    json proof_to_json(const core::Proof& p) {
        return json{
            {"id", p.id},
            {"challengeId", p.challenge_id},
            {"solver", p.solver},
            {"completionTime", p.completion_time},
            {"score", p.score},
            {"solutionDigest", p.solution_digest},
            {"externalProof", p.external_proof},
            {"verified", p.verified},
            {"submittedAt", p.submitted_at},
            {"verifiedAt", p.verified_at},
            {"rejectionCount", p.rejection_count}
        };
    }

    core::Proof proof_from_json(const json& j) {
        core::Proof p;
        p.id = j.at("id").get<ProofId>();
        p.challenge_id = j.at("challengeId").get<ChallengeId>();
        p.solver = j.at("solver").get<ParticipantId>();
        p.completion_time = j.at("completionTime").get<uint64_t>();
        p.solution_digest = j.at("solutionDigest").get<std::string>();
        p.external_proof = j.at("externalProof").get<std::string>();
        p.verified = j.at("verified").get<bool>();
        p.submitted_at = j.at("submittedAt").get<uint64_t>();
        p.verified_at = j.value("verifiedAt", uint64_t{0});
        p.rejection_count = j.contains("rejectionCount")
            ? read_bounded<uint32_t>(j, "rejectionCount", 0, UINT32_MAX, "proof " + std::to_string(p.id))
            : 0;

        if (p.id == NO_ID) {
            corrupted("proof with id 0");
        }
        p.score = read_bounded<uint32_t>(j, "score", 0, constants::MAX_SCORE,
                                         "proof " + std::to_string(p.id));
        return p;
    }

    json credential_to_json(const core::Credential& c) {
        return json{
            {"tokenId", c.token_id},
            {"owner", c.owner},
            {"skillType", c.skill_type},
            {"proficiencyLevel", c.proficiency_level},
            {"verificationCount", c.verification_count},
            {"createdAt", c.created_at},
            {"updatedAt", c.updated_at},
            {"solutionDigests", c.solution_digests}
        };
    }

    core::Credential credential_from_json(const json& j) {
        core::Credential c;
        c.token_id = j.at("tokenId").get<TokenId>();
        c.owner = j.at("owner").get<ParticipantId>();
        c.skill_type = j.at("skillType").get<std::string>();
        c.created_at = j.at("createdAt").get<uint64_t>();
        c.updated_at = j.value("updatedAt", c.created_at);
        c.solution_digests = j.at("solutionDigests").get<std::vector<std::string>>();

        if (c.token_id == NO_ID) {
            corrupted("credential with token id 0");
        }
        auto record = "credential " + std::to_string(c.token_id);
        c.proficiency_level = read_bounded<uint8_t>(j, "proficiencyLevel",
            constants::MIN_PROFICIENCY, constants::MAX_PROFICIENCY, record);
        c.verification_count = read_bounded<uint32_t>(j, "verificationCount", 1, UINT32_MAX, record);
        return c;
    }

    json audit_to_json(const core::SolutionAuditEntry& e) {
        return json{
            {"tokenId", e.token_id},
            {"proofId", e.proof_id},
            {"solutionDigest", e.solution_digest},
            {"recordedAt", e.recorded_at}
        };
    }

    core::SolutionAuditEntry audit_from_json(const json& j) {
        core::SolutionAuditEntry e;
        e.token_id = j.at("tokenId").get<TokenId>();
        e.proof_id = j.at("proofId").get<ProofId>();
        e.solution_digest = j.at("solutionDigest").get<std::string>();
        e.recorded_at = j.at("recordedAt").get<uint64_t>();
        return e;
    }

    json account_to_json(const core::EscrowAccount& a) {
        return json{
            {"challengeId", a.challenge_id},
            {"rewardAmount", a.reward_amount},
            {"deposited", a.deposited},
            {"held", a.held},
            {"payouts", a.payouts}
        };
    }

    core::EscrowAccount account_from_json(const json& j) {
        core::EscrowAccount a;
        a.challenge_id = j.at("challengeId").get<ChallengeId>();
        a.reward_amount = j.at("rewardAmount").get<Amount>();
        a.deposited = j.at("deposited").get<Amount>();
        a.held = j.at("held").get<Amount>();
        a.payouts = read_bounded<uint32_t>(j, "payouts", 0, UINT32_MAX,
                                           "escrow account " + std::to_string(a.challenge_id));
        return a;
    }

    json payout_to_json(const core::PayoutRecord& r) {
        return json{
            {"sequence", r.sequence},
            {"challengeId", r.challenge_id},
            {"proofId", r.proof_id},
            {"recipient", r.recipient},
            {"amount", r.amount},
            {"paidAt", r.paid_at}
        };
    }

    core::PayoutRecord payout_from_json(const json& j) {
        core::PayoutRecord r;
        r.sequence = j.at("sequence").get<uint64_t>();
        r.challenge_id = j.at("challengeId").get<ChallengeId>();
        r.proof_id = j.at("proofId").get<ProofId>();
        r.recipient = j.at("recipient").get<ParticipantId>();
        r.amount = j.at("amount").get<Amount>();
        r.paid_at = j.at("paidAt").get<uint64_t>();
        return r;
    }

    template<typename Records, typename IdFn>
    void check_counter(const Records& records, uint64_t next_id, IdFn id_of, const char* table) {
        std::set<uint64_t> seen;
        for (const auto& record : records) {
            auto id = id_of(record);
            if (!seen.insert(id).second) {
                corrupted(std::string(table) + " contains duplicate id " + std::to_string(id));
            }
            if (id >= next_id) {
                corrupted(std::string(table) + " id " + std::to_string(id) +
                          " is not below the next id counter");
            }
        }
    }

    auto challenge_index_key(const core::Challenge& c) { return std::make_pair(c.creator, c.id); }
    auto proof_index_key(const core::Proof& p) { return std::make_pair(p.solver, p.id); }
    auto credential_index_key(const core::Credential& c) { return std::make_pair(c.owner, c.token_id); }

} // namespace

SnapshotStore::SnapshotStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

bool SnapshotStore::exists() const {
    return std::filesystem::exists(path_);
}

json SnapshotStore::to_json(const ledger::LedgerSnapshot& snapshot) {
    json document;
    document["version"] = FORMAT_VERSION;

    json challenges = json::array();
    for (const auto& c : snapshot.challenges.challenges) {
        challenges.push_back(challenge_to_json(c));
    }
    document["challenges"] = challenges;

    json proofs = json::array();
    for (const auto& p : snapshot.proofs.proofs) {
        proofs.push_back(proof_to_json(p));
    }
    document["proofs"] = proofs;

    json credentials = json::array();
    for (const auto& c : snapshot.credentials.credentials) {
        credentials.push_back(credential_to_json(c));
    }
    document["credentials"] = credentials;

    json audit = json::array();
    for (const auto& e : snapshot.credentials.audit_log) {
        audit.push_back(audit_to_json(e));
    }
    document["auditLog"] = audit;

    json accounts = json::array();
    for (const auto& a : snapshot.escrow.accounts) {
        accounts.push_back(account_to_json(a));
    }
    json payouts = json::array();
    for (const auto& r : snapshot.escrow.payouts) {
        payouts.push_back(payout_to_json(r));
    }
    document["escrow"] = {
        {"accounts", accounts},
        {"balances", snapshot.escrow.balances},
        {"payouts", payouts},
        {"nextSequence", snapshot.escrow.next_sequence}
    };

    document["indexes"] = {
        {"challengesByCreator", index_to_json(build_index(snapshot.challenges.challenges, challenge_index_key))},
        {"proofsBySolver", index_to_json(build_index(snapshot.proofs.proofs, proof_index_key))},
        {"credentialsByOwner", index_to_json(build_index(snapshot.credentials.credentials, credential_index_key))}
    };

    document["counters"] = {
        {"nextChallengeId", snapshot.challenges.next_id},
        {"nextProofId", snapshot.proofs.next_id},
        {"nextTokenId", snapshot.credentials.next_token_id}
    };

    return document;
}

ledger::LedgerSnapshot SnapshotStore::from_json(const json& document) {
    ledger::LedgerSnapshot snapshot;

    try {
        auto version = document.at("version").get<int>();
        if (version != FORMAT_VERSION) {
            throw StorageException(ErrorCode::DeserializationFailed,
                "unsupported snapshot version " + std::to_string(version));
        }

        for (const auto& j : document.at("challenges")) {
            snapshot.challenges.challenges.push_back(challenge_from_json(j));
        }
        for (const auto& j : document.at("proofs")) {
            snapshot.proofs.proofs.push_back(proof_from_json(j));
        }
        for (const auto& j : document.at("credentials")) {
            snapshot.credentials.credentials.push_back(credential_from_json(j));
        }
        for (const auto& j : document.at("auditLog")) {
            snapshot.credentials.audit_log.push_back(audit_from_json(j));
        }

        const auto& escrow = document.at("escrow");
        for (const auto& j : escrow.at("accounts")) {
            snapshot.escrow.accounts.push_back(account_from_json(j));
        }
        snapshot.escrow.balances = escrow.at("balances").get<std::map<ParticipantId, Amount>>();
        for (const auto& j : escrow.at("payouts")) {
            snapshot.escrow.payouts.push_back(payout_from_json(j));
        }
        snapshot.escrow.next_sequence = escrow.at("nextSequence").get<uint64_t>();

        const auto& counters = document.at("counters");
        snapshot.challenges.next_id = counters.at("nextChallengeId").get<ChallengeId>();
        snapshot.proofs.next_id = counters.at("nextProofId").get<ProofId>();
        snapshot.credentials.next_token_id = counters.at("nextTokenId").get<TokenId>();

        // Consistency checks
        check_counter(snapshot.challenges.challenges, snapshot.challenges.next_id,
                      [](const core::Challenge& c) { return c.id; }, "challenges");
        check_counter(snapshot.proofs.proofs, snapshot.proofs.next_id,
                      [](const core::Proof& p) { return p.id; }, "proofs");
        check_counter(snapshot.credentials.credentials, snapshot.credentials.next_token_id,
                      [](const core::Credential& c) { return c.token_id; }, "credentials");

        std::set<std::pair<ParticipantId, std::string>> skills;
        for (const auto& c : snapshot.credentials.credentials) {
            if (!skills.insert(std::make_pair(c.owner, c.skill_type)).second) {
                corrupted("more than one credential for " + c.owner + "/" + c.skill_type);
            }
        }

        const auto& indexes = document.at("indexes");
        if (index_from_json(indexes.at("challengesByCreator")) !=
                build_index(snapshot.challenges.challenges, challenge_index_key) ||
            index_from_json(indexes.at("proofsBySolver")) !=
                build_index(snapshot.proofs.proofs, proof_index_key) ||
            index_from_json(indexes.at("credentialsByOwner")) !=
                build_index(snapshot.credentials.credentials, credential_index_key)) {
            corrupted("indexes do not match table contents");
        }
    } catch (const json::exception& e) {
        throw StorageException(ErrorCode::DeserializationFailed,
            std::string("malformed snapshot: ") + e.what());
    }

    return snapshot;
}

void SnapshotStore::save(const ledger::LedgerSnapshot& snapshot) const {
    auto document = to_json(snapshot);

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "cannot create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    auto tmp_path = path_;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "failed to open " + tmp_path.string());
        }
        file << document.dump(2);
        if (!file) {
            throw StorageException(ErrorCode::StorageWriteFailed,
                "failed to write " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        throw StorageException(ErrorCode::StorageWriteFailed,
            "failed to replace " + path_.string() + ": " + ec.message());
    }

    SKILLMINT_LOG_DEBUG("Snapshot saved to {}", path_.string());
}

ledger::LedgerSnapshot SnapshotStore::load() const {
    std::ifstream file(path_);
    if (!file) {
        throw StorageException(ErrorCode::StorageReadFailed, "failed to open " + path_.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw StorageException(ErrorCode::StorageCorrupted,
            "failed to parse " + path_.string() + ": " + e.what());
    }

    auto snapshot = from_json(document);
    SKILLMINT_LOG_DEBUG("Snapshot loaded from {}", path_.string());
    return snapshot;
}

} // namespace skillmint::storage
