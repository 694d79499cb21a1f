#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Core components
#include "core/ledger/skill_ledger.hpp"
#include "core/proof/verifier.hpp"

// Storage
#include "storage/snapshot_store.hpp"
#include "storage/completion_log.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "skillmint/common.hpp"
#include "skillmint/error.hpp"
#include "skillmint/time_utils.hpp"

namespace {

using json = nlohmann::json;
using Args = std::vector<std::string>;

void print_usage() {
    std::cerr <<
        "Usage: skillmint [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  create-challenge <creator> <type> <difficulty> <time-limit> <reward> <funds> <digest>\n"
        "  deactivate <challenge-id> <caller>\n"
        "  submit <challenge-id> <solver> <completion-time> <score> <solution-digest> <proof-token>\n"
        "  verify <proof-id>\n"
        "  challenge <challenge-id>\n"
        "  proof <proof-id>\n"
        "  credentials <owner>\n"
        "  credential <token-id>\n"
        "  derive-account <token-id> <requester>\n"
        "  balance <participant>\n"
        "  issue-token <solution-digest> <challenge-digest>\n";
}

// Unsigned decimal argument; "-5" and trailing junk are rejected
std::optional<uint64_t> parse_unsigned(const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        auto value = std::stoull(text, &consumed, 10);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

uint64_t require_unsigned(const std::string& text, const char* what) {
    auto value = parse_unsigned(text);
    if (!value) {
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + text + "'");
    }
    return *value;
}

json challenge_to_json(const skillmint::core::Challenge& c) {
    return {
        {"id", c.id},
        {"creator", c.creator},
        {"challengeType", c.challenge_type},
        {"difficulty", c.difficulty},
        {"timeLimit", c.time_limit},
        {"rewardAmount", c.reward_amount},
        {"active", c.active},
        {"contentDigest", c.content_digest},
        {"createdAt", c.created_at}
    };
}

json proof_to_json(const skillmint::core::Proof& p) {
    return {
        {"id", p.id},
        {"challengeId", p.challenge_id},
        {"solver", p.solver},
        {"completionTime", p.completion_time},
        {"score", p.score},
        {"solutionDigest", p.solution_digest},
        {"verified", p.verified},
        {"submittedAt", p.submitted_at},
        {"verifiedAt", p.verified_at},
        {"rejectionCount", p.rejection_count}
    };
}

json credential_to_json(const skillmint::core::Credential& c) {
    return {
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

// Prints the error and returns the process exit code
int report(const skillmint::Error& error) {
    std::cerr << error.to_string() << std::endl;
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        // ========================================================================
        // ARGUMENTS
        // ========================================================================

        std::string config_path = "skillmint.conf";
        Args args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                args.push_back(arg);
            }
        }

        if (args.empty()) {
            print_usage();
            return 2;
        }

        const std::string command = args.front();
        args.erase(args.begin());

        auto need = [&](size_t count) {
            if (args.size() != count) {
                throw std::invalid_argument(command + " expects " + std::to_string(count) +
                                            " argument(s), got " + std::to_string(args.size()));
            }
        };

        // Commands that do not touch the ledger
        if (command == "issue-token") {
            need(2);
            std::cout << skillmint::core::CommitmentVerifier::issue(args[0], args[1]) << std::endl;
            return 0;
        }

        // ========================================================================
        // CONFIGURATION AND LOGGING
        // ========================================================================

        auto config = skillmint::utils::Config::defaults();
        if (std::filesystem::exists(config_path)) {
            config.merge(skillmint::utils::Config::load_from_file(config_path));
        }

        skillmint::utils::Logger::init(
            config.get_or<std::string>("log_level", "info"),
            config.get_or<bool>("log_to_file", false),
            config.get_or<std::string>("log_file", "skillmint.log"));

        SKILLMINT_LOG_DEBUG("skillmint v{}.{}.{}",
            SKILLMINT_VERSION_MAJOR, SKILLMINT_VERSION_MINOR, SKILLMINT_VERSION_PATCH);

        auto verifier_name = config.get_or<std::string>("verifier", "non_empty");
        auto verifier = skillmint::core::make_verifier(verifier_name);
        if (!verifier) {
            throw skillmint::ConfigException("unknown verifier '" + verifier_name + "'");
        }

        auto policy_name = config.get_or<std::string>("payout_policy", "decrementing");
        auto policy = skillmint::core::payout_policy_from_string(policy_name);
        if (!policy) {
            throw skillmint::ConfigException("unknown payout_policy '" + policy_name + "'");
        }

        // ========================================================================
        // LEDGER
        // ========================================================================

        std::filesystem::path data_dir = config.get_or<std::string>("data_dir", "./data");
        skillmint::storage::SnapshotStore store(
            data_dir / config.get_or<std::string>("snapshot_file", "ledger.json"));
        skillmint::storage::CompletionLog completions(
            data_dir / config.get_or<std::string>("completion_log_dir", "completions"));

        skillmint::ledger::SkillLedger ledger(std::move(verifier), *policy);
        if (store.exists()) {
            ledger.restore(store.load());
            SKILLMINT_LOG_DEBUG("Loaded ledger from {}", store.path().string());
        }
        ledger.subscribe(completions.as_callback());

        auto persist = [&]() {
            store.save(ledger.snapshot());
        };

        // ========================================================================
        // COMMANDS
        // ========================================================================

        if (command == "create-challenge") {
            need(7);
            auto result = ledger.create_challenge(
                args[0], args[1],
                static_cast<uint32_t>(std::min<uint64_t>(require_unsigned(args[2], "difficulty"), UINT32_MAX)),
                require_unsigned(args[3], "time limit"),
                require_unsigned(args[4], "reward"),
                require_unsigned(args[5], "funds"),
                args[6]);
            if (result.is_err()) {
                return report(result.error());
            }
            persist();
            std::cout << result.value() << std::endl;
            return 0;
        }

        if (command == "deactivate") {
            need(2);
            auto result = ledger.deactivate_challenge(require_unsigned(args[0], "challenge id"), args[1]);
            if (result.is_err()) {
                return report(result.error());
            }
            persist();
            return 0;
        }

        if (command == "submit") {
            need(6);
            auto result = ledger.submit_proof(
                require_unsigned(args[0], "challenge id"),
                args[1],
                require_unsigned(args[2], "completion time"),
                static_cast<uint32_t>(std::min<uint64_t>(require_unsigned(args[3], "score"), UINT32_MAX)),
                args[4],
                args[5]);
            if (result.is_err()) {
                return report(result.error());
            }
            persist();
            std::cout << result.value() << std::endl;
            return 0;
        }

        if (command == "verify") {
            need(1);
            auto result = ledger.verify_proof(require_unsigned(args[0], "proof id"));
            if (result.is_err()) {
                return report(result.error());
            }
            persist();
            const auto& outcome = result.value();
            json out = {{"proofId", outcome.proof_id}, {"valid", outcome.valid}};
            if (outcome.valid) {
                out["tokenId"] = outcome.token_id;
                out["minted"] = outcome.minted;
                out["proficiencyLevel"] = outcome.proficiency_level;
                out["verificationCount"] = outcome.verification_count;
                out["rewardPaid"] = outcome.reward_paid;
            }
            std::cout << out.dump(2) << std::endl;
            return outcome.valid ? 0 : 3;
        }

        if (command == "challenge") {
            need(1);
            auto challenge = ledger.get_challenge(require_unsigned(args[0], "challenge id"));
            if (!challenge) {
                return report(skillmint::Error(skillmint::ErrorCode::ChallengeNotFound, "no such challenge"));
            }
            auto out = challenge_to_json(*challenge);
            out["heldBalance"] = ledger.held_balance(challenge->id);
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (command == "proof") {
            need(1);
            auto proof = ledger.get_proof(require_unsigned(args[0], "proof id"));
            if (!proof) {
                return report(skillmint::Error(skillmint::ErrorCode::ProofNotFound, "no such proof"));
            }
            std::cout << proof_to_json(*proof).dump(2) << std::endl;
            return 0;
        }

        if (command == "credentials") {
            need(1);
            json out = json::array();
            for (auto token_id : ledger.get_credentials_of(args[0])) {
                if (auto credential = ledger.get_credential(token_id)) {
                    out.push_back(credential_to_json(*credential));
                }
            }
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        if (command == "credential") {
            need(1);
            auto credential = ledger.get_credential(require_unsigned(args[0], "token id"));
            if (!credential) {
                return report(skillmint::Error(skillmint::ErrorCode::CredentialNotFound, "no such credential"));
            }
            std::cout << credential_to_json(*credential).dump(2) << std::endl;
            return 0;
        }

        if (command == "derive-account") {
            need(2);
            auto result = ledger.derive_account(require_unsigned(args[0], "token id"), args[1]);
            if (result.is_err()) {
                return report(result.error());
            }
            std::cout << result.value() << std::endl;
            return 0;
        }

        if (command == "balance") {
            need(1);
            std::cout << ledger.balance_of(args[0]) << std::endl;
            return 0;
        }

        std::cerr << "Unknown command: " << command << std::endl;
        print_usage();
        return 2;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
