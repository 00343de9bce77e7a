#include "OperationResult.hpp"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidSettings: return "InvalidSettings";
        case ErrorCode::NoProjectLoaded: return "NoProjectLoaded";
        case ErrorCode::DirectoryCreateFailed: return "DirectoryCreateFailed";
        case ErrorCode::CopyFailed: return "CopyFailed";
        case ErrorCode::SaveFailed: return "SaveFailed";
        case ErrorCode::VerificationFailed: return "VerificationFailed";
        case ErrorCode::SuffixExhausted: return "SuffixExhausted";
        case ErrorCode::VersionLimitReached: return "VersionLimitReached";
        case ErrorCode::OperationCancelled: return "OperationCancelled";
        case ErrorCode::ArchiveDestinationNotSet: return "ArchiveDestinationNotSet";
        case ErrorCode::ArchiveDestinationOverlap: return "ArchiveDestinationOverlap";
        case ErrorCode::PartialArchiveFailure: return "PartialArchiveFailure";
    }
    return "Unknown";
}
