#include "storage/completion_log.hpp"
#include "skillmint/error.hpp"
#include "skillmint/time_utils.hpp"
#include "utils/logger.hpp"
#include <fstream>

namespace skillmint::storage {

using json = nlohmann::json;

CompletionLog::CompletionLog(std::filesystem::path directory)
    : directory_(std::move(directory))
{
}

std::filesystem::path CompletionLog::day_file(const std::string& day) const {
    return directory_ / ("completions_" + day + ".jsonl");
}

std::string CompletionLog::record(const ledger::LedgerEvent& event) {
    if (event.event_type != ledger::EventType::PROOF_VERIFIED) {
        return {};
    }

    auto challenge_id = event.data.value("challengeId", uint64_t{0});
    auto log_id = std::to_string(challenge_id) + "_" + event.participant + "_" +
                  std::to_string(event.timestamp);

    json entry = {
        {"logId", log_id},
        {"timestamp", time::to_string(time::from_timestamp(event.timestamp))},
        {"proofId", event.subject_id},
        {"solver", event.participant}
    };
    for (auto it = event.data.begin(); it != event.data.end(); ++it) {
        entry[it.key()] = it.value();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw StorageException(ErrorCode::StorageWriteFailed,
            "cannot create " + directory_.string() + ": " + ec.message());
    }

    auto path = day_file(time::day_stamp(event.timestamp));
    std::ofstream file(path, std::ios::app);
    if (!file) {
        throw StorageException(ErrorCode::StorageWriteFailed, "failed to open " + path.string());
    }
    file << entry.dump() << '\n';
    if (!file) {
        throw StorageException(ErrorCode::StorageWriteFailed, "failed to append to " + path.string());
    }

    SKILLMINT_LOG_DEBUG("Logged completion {}", log_id);
    return log_id;
}

std::vector<json> CompletionLog::read_day(const std::string& day) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<json> entries;
    auto path = day_file(day);
    if (!std::filesystem::exists(path)) {
        return entries;
    }

    std::ifstream file(path);
    if (!file) {
        throw StorageException(ErrorCode::StorageReadFailed, "failed to open " + path.string());
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            entries.push_back(json::parse(line));
        } catch (const json::parse_error& e) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "bad line in " + path.string() + ": " + e.what());
        }
    }
    return entries;
}

ledger::EventCallback CompletionLog::as_callback() {
    return [this](const ledger::LedgerEvent& event) {
        try {
            record(event);
        } catch (const StorageException& e) {
            // The verification itself is already committed
            SKILLMINT_LOG_ERROR("Completion log write failed: {}", e.what());
        }
    };
}

} // namespace skillmint::storage
