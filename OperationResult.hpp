#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ProjectInfo.hpp"

enum class ErrorCode {
    Ok,
    InvalidSettings,
    NoProjectLoaded,
    DirectoryCreateFailed,
    CopyFailed,
    SaveFailed,
    VerificationFailed,
    SuffixExhausted,
    VersionLimitReached,
    OperationCancelled,
    ArchiveDestinationNotSet,
    ArchiveDestinationOverlap,
    PartialArchiveFailure
};

const char* errorCodeName(ErrorCode code);

struct SnapshotResult {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::string folderName;
    std::filesystem::path targetPath;
    std::size_t fileCount = 0;
    std::vector<std::string> details; // ошибки по отдельным файлам / причины проверки

    bool succeeded() const { return code == ErrorCode::Ok; }
    bool isError() const { return code != ErrorCode::Ok && code != ErrorCode::OperationCancelled; }
};

struct ArchiveSelection {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    VersionId currentVersion = 0;
    std::vector<VersionEntry> allVersions;
    std::vector<VersionEntry> toArchive;

    bool succeeded() const { return code == ErrorCode::Ok; }
};

struct ArchiveResult {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::size_t selectedCount = 0;
    std::size_t archivedCount = 0;
    std::size_t skippedCount = 0;
    bool aborted = false;
    std::vector<std::string> errors;

    bool succeeded() const { return code == ErrorCode::Ok; }
    bool isError() const { return code != ErrorCode::Ok && code != ErrorCode::OperationCancelled; }
};
