#pragma once

#include "skillmint/common.hpp"
#include "core/ledger/events.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace skillmint::storage {

/**
 * CompletionLog - Append-only audit of verified challenge completions
 *
 * One JSON object per line in <dir>/completions_YYYYMMDD.jsonl (UTC day of
 * the completion). Entries carry a log id of the form
 * <challengeId>_<solver>_<timestamp>.
 */
class CompletionLog {
public:
    explicit CompletionLog(std::filesystem::path directory);

    /**
     * Append a completion built from a PROOF_VERIFIED event.
     * Other event types are ignored.
     * @return The log id, or empty if the event was ignored
     * @throws StorageException on I/O failure
     */
    std::string record(const ledger::LedgerEvent& event);

    /**
     * Read back all entries of a day
     * @param day YYYYMMDD
     */
    std::vector<nlohmann::json> read_day(const std::string& day) const;

    /**
     * Event callback that appends verified completions
     */
    ledger::EventCallback as_callback();

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
    mutable std::mutex mutex_;

    std::filesystem::path day_file(const std::string& day) const;
};

} // namespace skillmint::storage
