#include "ConflictResolver.hpp"

ConflictResolver::ConflictResolver(DecisionProvider& decisions, const FileOperations& files)
    : decisions(decisions), files(files) {}

ConflictDecision ConflictResolver::decideSnapshotConflict(const std::filesystem::path& parent,
                                                          const std::string& folderName) {
    ConflictDecision decision;
    decision.choice = decisions.decideSnapshotConflict(parent / folderName);

    if (decision.choice == SnapshotConflictChoice::Alongside) {
        auto suffix = findAlongsideSuffix(parent, folderName);
        if (suffix) {
            decision.suffix = *suffix;
        } else {
            decision.exhausted = true;
        }
    }
    return decision;
}

ArchiveConflictChoice ConflictResolver::decideArchiveConflict(const std::string& existingName) {
    return decisions.decideArchiveConflict(existingName);
}

std::optional<std::string> ConflictResolver::findAlongsideSuffix(const std::filesystem::path& parent,
                                                                 const std::string& folderName) const {
    for (char letter = 'a'; letter <= 'z'; ++letter) {
        std::string suffix = std::string("_") + letter;
        if (!files.exists(parent / (folderName + suffix))) {
            return suffix;
        }
    }
    return std::nullopt;
}
