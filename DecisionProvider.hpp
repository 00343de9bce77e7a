#pragma once

#include <deque>
#include <filesystem>
#include <string>
#include <vector>

#include "ProjectInfo.hpp"

enum class SnapshotConflictChoice { Alongside, Overwrite, Cancel };
enum class ArchiveConflictChoice { Skip, Replace, Abort };

// Точки принятия решений: пользователь (консоль) или заранее заданная политика
class DecisionProvider {
public:
    virtual ~DecisionProvider() = default;

    virtual SnapshotConflictChoice decideSnapshotConflict(const std::filesystem::path& targetPath) = 0;
    virtual ArchiveConflictChoice decideArchiveConflict(const std::string& existingName) = 0;
    virtual bool confirmArchive(const std::vector<VersionEntry>& entries,
                                const std::filesystem::path& destination) = 0;
};

class ScriptedDecisionProvider : public DecisionProvider {
public:
    ScriptedDecisionProvider(SnapshotConflictChoice snapshotChoice = SnapshotConflictChoice::Cancel,
                             ArchiveConflictChoice archiveChoice = ArchiveConflictChoice::Abort,
                             bool confirm = true);

    // Ответы из очереди используются раньше значений по умолчанию
    void queueArchiveChoice(ArchiveConflictChoice choice);
    void queueSnapshotChoice(SnapshotConflictChoice choice);

    SnapshotConflictChoice decideSnapshotConflict(const std::filesystem::path& targetPath) override;
    ArchiveConflictChoice decideArchiveConflict(const std::string& existingName) override;
    bool confirmArchive(const std::vector<VersionEntry>& entries,
                        const std::filesystem::path& destination) override;

    const std::vector<std::string>& askedAbout() const { return m_asked; }

private:
    SnapshotConflictChoice m_snapshotChoice;
    ArchiveConflictChoice m_archiveChoice;
    bool m_confirm;
    std::deque<SnapshotConflictChoice> m_snapshotQueue;
    std::deque<ArchiveConflictChoice> m_archiveQueue;
    std::vector<std::string> m_asked;
};

bool parseSnapshotChoice(const std::string& text, SnapshotConflictChoice& out);
bool parseArchiveChoice(const std::string& text, ArchiveConflictChoice& out);
