#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "DirectoryScanner.hpp"
#include "NameCodec.hpp"
#include "ProjectInfo.hpp"
#include "Settings.hpp"

class VersionResolver {
public:
    explicit VersionResolver(const Settings& settings);

    // nullopt, если проект не загружен (нет пути)
    std::optional<ProjectInfo> resolveProjectInfo(const std::optional<std::filesystem::path>& livePath) const;

    // Папки-версии baseName в parent по возрастанию: сам baseName (v0) или baseName + точный суффикс.
    // "Song_extra_v001" и "Song_v1" (не та ширина) к "Song" не относятся.
    std::vector<VersionEntry> listVersions(const std::filesystem::path& parent, const std::string& baseName) const;

    // Старшая положительная версия среди соседей, 0 если нет
    VersionId findHighestVersion(const std::filesystem::path& parent, const std::string& baseName) const;

    // std::overflow_error, если у текущей/старшей версии нет следующей
    VersionId nextVersion(const ProjectInfo& info) const;

    std::string versionFolderName(const ProjectInfo& info, VersionId version) const;

    static std::string versionDisplay(const std::optional<ProjectInfo>& info);
    static std::string projectDisplay(const std::optional<ProjectInfo>& info);

    const NameCodec& codec() const { return m_codec; }

private:
    static VersionId increment(VersionId version);

    Settings m_settings;
    NameCodec m_codec;
    DirectoryScanner m_scanner;
};
