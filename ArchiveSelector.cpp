#include "ArchiveSelector.hpp"
#include <exception>
#include <limits>

#include "VersionResolver.hpp"

long long ArchiveSelector::retentionCutoff(VersionId currentVersion, long long keepCount) {
    using Limits = std::numeric_limits<long long>;
    // Насыщение вместо переполнения при крайних keepCount
    if (keepCount >= 0) {
        return currentVersion < Limits::min() + keepCount ? Limits::min() : currentVersion - keepCount;
    }
    return currentVersion > Limits::max() + keepCount ? Limits::max() : currentVersion - keepCount;
}

std::vector<VersionEntry> ArchiveSelector::versionsToArchive(VersionId currentVersion, long long keepCount,
                                                             const std::vector<VersionEntry>& allVersions) {
    std::vector<VersionEntry> selected;
    const long long cutoff = retentionCutoff(currentVersion, keepCount);

    for (const auto& entry : allVersions) {
        if (entry.version < cutoff && entry.version != currentVersion) {
            selected.push_back(entry);
        }
    }
    return selected;
}

ArchiveSelection ArchiveSelector::select(const ProjectHost& host, const Settings& settings) const {
    ArchiveSelection selection;

    try {
        VersionResolver resolver(settings);
        auto info = resolver.resolveProjectInfo(host.currentProjectPath());
        if (!info) {
            selection.code = ErrorCode::NoProjectLoaded;
            selection.message = "No project loaded";
            return selection;
        }

        selection.currentVersion = info->currentVersion.value_or(0);
        selection.allVersions = resolver.listVersions(info->parentDirectory, info->baseName);
        if (selection.allVersions.empty()) {
            selection.message = "No versioned folders found";
            return selection;
        }

        selection.toArchive = versionsToArchive(selection.currentVersion, settings.versionsToKeep,
                                                selection.allVersions);
        selection.message = std::to_string(selection.toArchive.size()) + " of " +
                            std::to_string(selection.allVersions.size()) + " version(s) eligible for archiving";
    } catch (const std::exception& ex) {
        selection.code = ErrorCode::InvalidSettings;
        selection.message = std::string("Could not select versions: ") + ex.what();
    }
    return selection;
}
