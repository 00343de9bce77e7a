#include "DecisionProvider.hpp"
#include <algorithm>
#include <cctype>

ScriptedDecisionProvider::ScriptedDecisionProvider(SnapshotConflictChoice snapshotChoice,
                                                   ArchiveConflictChoice archiveChoice,
                                                   bool confirm)
    : m_snapshotChoice(snapshotChoice), m_archiveChoice(archiveChoice), m_confirm(confirm) {}

void ScriptedDecisionProvider::queueArchiveChoice(ArchiveConflictChoice choice) {
    m_archiveQueue.push_back(choice);
}

void ScriptedDecisionProvider::queueSnapshotChoice(SnapshotConflictChoice choice) {
    m_snapshotQueue.push_back(choice);
}

SnapshotConflictChoice ScriptedDecisionProvider::decideSnapshotConflict(const std::filesystem::path& targetPath) {
    m_asked.push_back(targetPath.filename().string());
    if (!m_snapshotQueue.empty()) {
        SnapshotConflictChoice choice = m_snapshotQueue.front();
        m_snapshotQueue.pop_front();
        return choice;
    }
    return m_snapshotChoice;
}

ArchiveConflictChoice ScriptedDecisionProvider::decideArchiveConflict(const std::string& existingName) {
    m_asked.push_back(existingName);
    if (!m_archiveQueue.empty()) {
        ArchiveConflictChoice choice = m_archiveQueue.front();
        m_archiveQueue.pop_front();
        return choice;
    }
    return m_archiveChoice;
}

bool ScriptedDecisionProvider::confirmArchive(const std::vector<VersionEntry>&, const std::filesystem::path&) {
    return m_confirm;
}

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

bool parseSnapshotChoice(const std::string& text, SnapshotConflictChoice& out) {
    std::string value = lower(text);
    if (value == "alongside" || value == "a") {
        out = SnapshotConflictChoice::Alongside;
    } else if (value == "overwrite" || value == "o") {
        out = SnapshotConflictChoice::Overwrite;
    } else if (value == "cancel" || value == "c") {
        out = SnapshotConflictChoice::Cancel;
    } else {
        return false;
    }
    return true;
}

bool parseArchiveChoice(const std::string& text, ArchiveConflictChoice& out) {
    std::string value = lower(text);
    if (value == "skip" || value == "s") {
        out = ArchiveConflictChoice::Skip;
    } else if (value == "replace" || value == "r") {
        out = ArchiveConflictChoice::Replace;
    } else if (value == "abort" || value == "a") {
        out = ArchiveConflictChoice::Abort;
    } else {
        return false;
    }
    return true;
}
