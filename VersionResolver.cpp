// VersionResolver.cpp
#include "VersionResolver.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

VersionResolver::VersionResolver(const Settings& settings)
    : m_settings(settings), m_codec(settings) {}

std::optional<ProjectInfo> VersionResolver::resolveProjectInfo(const std::optional<fs::path>& livePath) const {
    if (!livePath || livePath->empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::path full = fs::absolute(*livePath, ec);
    if (ec) {
        full = *livePath;
    }
    full = full.lexically_normal();
    if (!full.has_filename()) {
        return std::nullopt;
    }

    ProjectInfo info;
    info.fullPath = full;
    info.directory = full.parent_path();
    info.filename = full.filename().string();
    info.stem = full.stem().string();
    info.extension = full.extension().string();

    // Проект в корне ФС: версии создаются рядом с ним, в той же папке
    fs::path parent = info.directory.parent_path();
    if (parent.empty() || parent == info.directory || parent == info.directory.root_path()) {
        parent = info.directory;
    }
    info.parentDirectory = parent;

    info.baseName = info.stem;
    if (auto pos = m_codec.suffixPosition(info.stem)) {
        info.currentVersion = m_codec.decode(info.stem);
        if (info.currentVersion) {
            info.baseName = info.stem.substr(0, *pos);
        }
    }
    return info;
}

std::vector<VersionEntry> VersionResolver::listVersions(const fs::path& parent, const std::string& baseName) const {
    std::vector<VersionEntry> versions;

    for (const auto& name : m_scanner.listSiblings(parent)) {
        if (name == baseName) {
            versions.push_back({name, 0, parent / name});
            continue;
        }
        if (name.size() <= baseName.size() || name.compare(0, baseName.size(), baseName) != 0) {
            continue;
        }

        std::string remainder = name.substr(baseName.size());
        auto version = m_codec.decode(remainder);
        if (!version || *version <= 0) {
            continue;
        }
        if (remainder == m_codec.encode(*version)) {
            versions.push_back({name, *version, parent / name});
        }
    }

    std::sort(versions.begin(), versions.end(),
              [](const VersionEntry& a, const VersionEntry& b) { return a.version < b.version; });
    return versions;
}

VersionId VersionResolver::findHighestVersion(const fs::path& parent, const std::string& baseName) const {
    VersionId highest = 0;
    for (const auto& entry : listVersions(parent, baseName)) {
        highest = std::max(highest, entry.version);
    }
    return highest;
}

VersionId VersionResolver::nextVersion(const ProjectInfo& info) const {
    if (info.currentVersion) {
        return increment(*info.currentVersion);
    }

    VersionId highest = findHighestVersion(info.parentDirectory, info.baseName);
    if (highest > 0) {
        return increment(highest);
    }
    return m_settings.startVersion;
}

VersionId VersionResolver::increment(VersionId version) {
    if (version == std::numeric_limits<VersionId>::max()) {
        throw std::overflow_error("Version limit reached: v" + std::to_string(version) + " has no successor");
    }
    return version + 1;
}

std::string VersionResolver::versionFolderName(const ProjectInfo& info, VersionId version) const {
    return info.baseName + m_codec.encode(version);
}

std::string VersionResolver::versionDisplay(const std::optional<ProjectInfo>& info) {
    if (!info) {
        return "No project loaded";
    }
    if (info->currentVersion) {
        return "v" + std::to_string(*info->currentVersion);
    }
    return "Not versioned";
}

std::string VersionResolver::projectDisplay(const std::optional<ProjectInfo>& info) {
    if (!info) {
        return "No project loaded";
    }
    return info->baseName;
}
