#pragma once

#include <vector>

#include "OperationResult.hpp"
#include "ProjectHost.hpp"
#include "Settings.hpp"

class ArchiveSelector {
public:
    // Версии строго старше (currentVersion - keepCount), по возрастанию.
    // Текущая версия не выбирается ни при каком keepCount, включая 0 и отрицательные.
    static std::vector<VersionEntry> versionsToArchive(VersionId currentVersion, long long keepCount,
                                                       const std::vector<VersionEntry>& allVersions);

    // Проект хоста -> все его версии -> кандидаты на архивирование.
    // Отсутствие версий - не ошибка: code == Ok, toArchive пуст.
    ArchiveSelection select(const ProjectHost& host, const Settings& settings) const;

    // currentVersion - keepCount, прижатое к границам long long
    static long long retentionCutoff(VersionId currentVersion, long long keepCount);
};
