#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ChecksumService.hpp"
#include "DecisionProvider.hpp"
#include "FileOperations.hpp"
#include "OperationResult.hpp"
#include "ProjectHost.hpp"
#include "Settings.hpp"

// Перенос старых версий в архив: копия -> проверка -> удаление источника.
// Источник удаляется только после подтверждённой копии; ошибки по версиям копятся, прогон идёт дальше.
// Досрочно останавливает только Abort.
class ArchiveMover {
public:
    ArchiveMover(DecisionProvider& decisions, FileOperations& files, ChecksumService& checksum,
                 bool verifyChecksums = true);

    // Полный прогон: проверка назначения, выбор версий, подтверждение, перенос
    ArchiveResult run(const ProjectHost& host, const Settings& settings);

    ArchiveResult moveAll(const std::vector<VersionEntry>& entries, const std::filesystem::path& destination);

    // Папка в архиве совпадает с версией, лежит внутри неё или содержит её
    static bool overlaps(const VersionEntry& entry, const std::filesystem::path& destination);

private:
    bool verifyCopy(const VersionEntry& entry, const std::filesystem::path& destPath, std::string& reason) const;
    void summarize(ArchiveResult& result) const;

    DecisionProvider& decisions;
    FileOperations& files;
    ChecksumService& checksum;
    bool verifyChecksums;
};
