// ArchiveMover.cpp
#include "ArchiveMover.hpp"
#include <exception>
#include <iostream>
#include <sstream>
#include <system_error>

#include "ArchiveSelector.hpp"
#include "ConflictResolver.hpp"

namespace fs = std::filesystem;

namespace {

// Абсолютный путь с раскрытыми симлинками существующей части
fs::path resolved(const fs::path& path) {
    std::error_code ec;
    fs::path result = fs::weakly_canonical(path, ec);
    if (ec) {
        result = fs::absolute(path, ec).lexically_normal();
    }
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path();
    }
    return result;
}

bool isSameOrInside(const fs::path& inner, const fs::path& outer) {
    fs::path rel = inner.lexically_relative(outer);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

ArchiveMover::ArchiveMover(DecisionProvider& decisions, FileOperations& files, ChecksumService& checksum,
                           bool verifyChecksums)
    : decisions(decisions), files(files), checksum(checksum), verifyChecksums(verifyChecksums) {}

ArchiveResult ArchiveMover::run(const ProjectHost& host, const Settings& settings) {
    ArchiveResult result;

    if (settings.archiveDestination.empty()) {
        result.code = ErrorCode::ArchiveDestinationNotSet;
        result.message = "Archive destination not set";
        return result;
    }

    fs::path destination(settings.archiveDestination);
    ArchiveSelector selector;
    ArchiveSelection selection = selector.select(host, settings);
    if (!selection.succeeded()) {
        result.code = selection.code;
        result.message = selection.message;
        return result;
    }

    // Архив в папке проектов или внутри версии уничтожил бы источник
    for (const auto& entry : selection.allVersions) {
        if (overlaps(entry, destination)) {
            result.code = ErrorCode::ArchiveDestinationOverlap;
            result.message = "Archive destination " + destination.string() + " overlaps version folder " +
                             entry.path.string();
            std::cerr << "  ⚠ " << result.message << std::endl;
            return result;
        }
    }

    if (!files.isDirectory(destination)) {
        std::string error;
        if (!files.createDirectories(destination, error)) {
            result.code = ErrorCode::DirectoryCreateFailed;
            result.message = "Could not create archive destination: " + error;
            return result;
        }
        std::cout << "  → Created archive destination " << destination.string() << std::endl;
    }

    if (selection.toArchive.empty()) {
        result.message = selection.allVersions.empty() ? selection.message : "No versions to archive";
        return result;
    }

    if (!decisions.confirmArchive(selection.toArchive, destination)) {
        result.selectedCount = selection.toArchive.size();
        result.code = ErrorCode::OperationCancelled;
        result.message = "Archiving cancelled by user";
        return result;
    }

    return moveAll(selection.toArchive, destination);
}

ArchiveResult ArchiveMover::moveAll(const std::vector<VersionEntry>& entries, const fs::path& destination) {
    ArchiveResult result;
    result.selectedCount = entries.size();
    ConflictResolver conflicts(decisions, files);

    for (const auto& entry : entries) {
        fs::path destPath = destination / entry.name;
        std::cout << "  → Archiving " << entry.name << std::endl;

        if (overlaps(entry, destination)) {
            result.errors.push_back("Archive destination overlaps source: " + entry.name + " - " +
                                    destPath.string());
            continue;
        }

        if (files.exists(destPath)) {
            ArchiveConflictChoice choice = conflicts.decideArchiveConflict(entry.name);
            if (choice == ArchiveConflictChoice::Abort) {
                result.aborted = true;
                break;
            }
            if (choice == ArchiveConflictChoice::Skip) {
                ++result.skippedCount;
                std::cout << "  ↪ Skipped " << entry.name << std::endl;
                continue;
            }

            std::string error;
            if (!files.removeTree(destPath, error)) {
                result.errors.push_back("Could not remove existing archive: " + entry.name + " - " + error);
                continue;
            }
        }

        std::string error;
        if (!files.copyTree(entry.path, destPath, error)) {
            result.errors.push_back("Failed to archive: " + entry.name + " - " + error);
            continue;
        }

        std::string reason;
        if (!verifyCopy(entry, destPath, reason)) {
            result.errors.push_back("Copy verification failed: " + entry.name + (reason.empty() ? "" : " - " + reason));
            continue;
        }

        // Копия подтверждена, данные уже в двух местах
        ++result.archivedCount;
        error.clear();
        if (!files.removeTree(entry.path, error)) {
            result.errors.push_back("Archived but not removed from source: " + entry.name + " - " + error);
            continue;
        }
        std::cout << "  ✔ " << entry.name << " -> " << destPath.string() << std::endl;
    }

    summarize(result);
    return result;
}

bool ArchiveMover::overlaps(const VersionEntry& entry, const fs::path& destination) {
    fs::path source = resolved(entry.path);
    fs::path target = resolved(destination / entry.name);
    return isSameOrInside(target, source) || isSameOrInside(source, target);
}

bool ArchiveMover::verifyCopy(const VersionEntry& entry, const fs::path& destPath, std::string& reason) const {
    if (!files.isDirectory(destPath)) {
        reason = "destination missing after copy";
        return false;
    }
    if (!verifyChecksums) {
        return true;
    }

    try {
        std::vector<std::string> mismatches = checksum.compareTrees(entry.path, destPath);
        if (mismatches.empty()) {
            return true;
        }
        reason = mismatches.front();
        if (mismatches.size() > 1) {
            reason += " (+" + std::to_string(mismatches.size() - 1) + " more)";
        }
    } catch (const std::exception& ex) {
        reason = ex.what();
    }
    return false;
}

void ArchiveMover::summarize(ArchiveResult& result) const {
    std::ostringstream msg;

    if (result.aborted) {
        msg << "Archiving aborted. Archived " << result.archivedCount << " version(s) before cancellation.";
    } else if (result.errors.empty()) {
        msg << "Successfully archived " << result.archivedCount << " version(s)";
        if (result.skippedCount > 0) {
            msg << ", skipped " << result.skippedCount;
        }
    } else {
        msg << "Archived " << result.archivedCount << "/" << result.selectedCount
            << " versions, skipped " << result.skippedCount << ", errors:";
    }
    if (!result.errors.empty()) {
        for (const auto& error : result.errors) {
            msg << "\n" << error;
        }
    }

    if (!result.errors.empty()) {
        result.code = ErrorCode::PartialArchiveFailure;
    } else if (result.aborted) {
        result.code = ErrorCode::OperationCancelled;
    } else {
        result.code = ErrorCode::Ok;
    }
    result.message = msg.str();

    if (result.isError()) {
        std::cerr << "  ⚠ " << result.message << std::endl;
    } else {
        std::cout << "  ✔ " << result.message << std::endl;
    }
}
