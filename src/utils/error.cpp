#include "skillmint/error.hpp"
#include <sstream>

namespace skillmint {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";

        case ErrorCode::InvalidDifficulty: return "Difficulty out of range";
        case ErrorCode::InvalidTimeLimit: return "Invalid time limit";
        case ErrorCode::InvalidScore: return "Score out of range";
        case ErrorCode::InvalidTag: return "Invalid type tag";

        case ErrorCode::NotChallengeCreator: return "Not challenge creator";
        case ErrorCode::NotCredentialOwner: return "Not credential owner";

        case ErrorCode::ChallengeInactive: return "Challenge not active";
        case ErrorCode::TimeLimitExceeded: return "Time limit exceeded";
        case ErrorCode::ProofAlreadyVerified: return "Proof already verified";
        case ErrorCode::VerificationInProgress: return "Verification in progress";

        case ErrorCode::InsufficientFunds: return "Insufficient funds";
        case ErrorCode::InsufficientEscrow: return "Insufficient escrow";
        case ErrorCode::RewardAlreadyPaid: return "Reward already paid";
        case ErrorCode::BalanceOverflow: return "Balance overflow";

        case ErrorCode::ChallengeNotFound: return "Challenge not found";
        case ErrorCode::ProofNotFound: return "Proof not found";
        case ErrorCode::CredentialNotFound: return "Credential not found";

        case ErrorCode::VerifierFailure: return "Proof verifier failed";

        case ErrorCode::StorageReadFailed: return "Storage read failed";
        case ErrorCode::StorageWriteFailed: return "Storage write failed";
        case ErrorCode::StorageCorrupted: return "Storage corrupted";

        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::DeserializationFailed: return "Deserialization failed";

        default: return "Unknown error code";
    }
}

ErrorCategory error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorCategory::None;

        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidDifficulty:
        case ErrorCode::InvalidTimeLimit:
        case ErrorCode::InvalidScore:
        case ErrorCode::InvalidTag:
            return ErrorCategory::Validation;

        case ErrorCode::NotChallengeCreator:
        case ErrorCode::NotCredentialOwner:
            return ErrorCategory::Authorization;

        case ErrorCode::ChallengeInactive:
        case ErrorCode::TimeLimitExceeded:
        case ErrorCode::ProofAlreadyVerified:
        case ErrorCode::VerificationInProgress:
            return ErrorCategory::State;

        case ErrorCode::InsufficientFunds:
        case ErrorCode::InsufficientEscrow:
        case ErrorCode::RewardAlreadyPaid:
        case ErrorCode::BalanceOverflow:
            return ErrorCategory::Resource;

        case ErrorCode::ChallengeNotFound:
        case ErrorCode::ProofNotFound:
        case ErrorCode::CredentialNotFound:
            return ErrorCategory::NotFound;

        default:
            return ErrorCategory::Internal;
    }
}

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Validation: return "ValidationError";
        case ErrorCategory::Authorization: return "AuthorizationError";
        case ErrorCategory::State: return "StateError";
        case ErrorCategory::Resource: return "ResourceError";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::Internal: return "InternalError";
        default: return "Unknown";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_category_to_string(category()) << ": "
        << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace skillmint
