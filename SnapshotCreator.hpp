#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "DecisionProvider.hpp"
#include "FileOperations.hpp"
#include "OperationResult.hpp"
#include "ProjectHost.hpp"
#include "Settings.hpp"

// Следующая версия активного проекта в соседней папке:
// версия -> конфликт -> папка -> копирование -> сохранение проекта -> проверка.
// При неудачной проверке записанная папка остаётся на месте, повторов нет.
class SnapshotCreator {
public:
    enum class State { Idle, Resolving, ConflictCheck, Creating, Copying, Saving, Verifying, Done, Cancelled, Failed };

    SnapshotCreator(const Settings& settings, ProjectHost& host, DecisionProvider& decisions, FileOperations& files);

    SnapshotResult create();

    State state() const { return m_state; }

private:
    SnapshotResult run();
    SnapshotResult fail(SnapshotResult result, ErrorCode code, const std::string& message);

    // Файлы проекта (относительные пути) без содержимого целевой папки, если она внутри проекта
    std::vector<std::filesystem::path> collectSourceFiles(const std::filesystem::path& sourceDir,
                                                          const std::filesystem::path& target) const;

    Settings m_settings;
    ProjectHost& host;
    DecisionProvider& decisions;
    FileOperations& files;
    State m_state = State::Idle;
};

const char* snapshotStateName(SnapshotCreator::State state);
