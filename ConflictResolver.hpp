#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "DecisionProvider.hpp"
#include "FileOperations.hpp"

struct ConflictDecision {
    SnapshotConflictChoice choice = SnapshotConflictChoice::Cancel;
    std::string suffix;     // только для Alongside
    bool exhausted = false; // Alongside выбран, но _a.._z заняты
};

class ConflictResolver {
public:
    ConflictResolver(DecisionProvider& decisions, const FileOperations& files);

    // Вызывается только когда parent/folderName уже существует
    ConflictDecision decideSnapshotConflict(const std::filesystem::path& parent, const std::string& folderName);

    ArchiveConflictChoice decideArchiveConflict(const std::string& existingName);

    // Первый свободный суффикс _a.._z для folderName в parent
    std::optional<std::string> findAlongsideSuffix(const std::filesystem::path& parent,
                                                   const std::string& folderName) const;

private:
    DecisionProvider& decisions;
    const FileOperations& files;
};
