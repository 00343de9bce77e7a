// SnapshotCreator.cpp
#include "SnapshotCreator.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ConflictResolver.hpp"
#include "VersionResolver.hpp"

namespace fs = std::filesystem;

namespace {

bool startsWith(const fs::path& path, const fs::path& prefix) {
    auto it = path.begin();
    for (const auto& part : prefix) {
        if (it == path.end() || *it != part) {
            return false;
        }
        ++it;
    }
    return true;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << separator;
        }
        out << items[i];
    }
    return out.str();
}

} // namespace

const char* snapshotStateName(SnapshotCreator::State state) {
    switch (state) {
        case SnapshotCreator::State::Idle: return "Idle";
        case SnapshotCreator::State::Resolving: return "Resolving";
        case SnapshotCreator::State::ConflictCheck: return "ConflictCheck";
        case SnapshotCreator::State::Creating: return "Creating";
        case SnapshotCreator::State::Copying: return "Copying";
        case SnapshotCreator::State::Saving: return "Saving";
        case SnapshotCreator::State::Verifying: return "Verifying";
        case SnapshotCreator::State::Done: return "Done";
        case SnapshotCreator::State::Cancelled: return "Cancelled";
        case SnapshotCreator::State::Failed: return "Failed";
    }
    return "Unknown";
}

SnapshotCreator::SnapshotCreator(const Settings& settings, ProjectHost& host,
                                 DecisionProvider& decisions, FileOperations& files)
    : m_settings(settings), host(host), decisions(decisions), files(files) {}

SnapshotResult SnapshotCreator::create() {
    try {
        return run();
    } catch (const std::exception& ex) {
        ErrorCode code = ErrorCode::VerificationFailed;
        switch (m_state) {
            case State::Idle:
            case State::Resolving: code = ErrorCode::InvalidSettings; break;
            case State::ConflictCheck:
            case State::Creating: code = ErrorCode::DirectoryCreateFailed; break;
            case State::Copying: code = ErrorCode::CopyFailed; break;
            case State::Saving: code = ErrorCode::SaveFailed; break;
            default: break;
        }
        std::string step = snapshotStateName(m_state);
        return fail(SnapshotResult(), code, "Snapshot failed during " + step + ": " + ex.what());
    }
}

SnapshotResult SnapshotCreator::fail(SnapshotResult result, ErrorCode code, const std::string& message) {
    m_state = State::Failed;
    result.code = code;
    result.message = message;
    std::cerr << "  ⚠ " << message << std::endl;
    return result;
}

std::vector<fs::path> SnapshotCreator::collectSourceFiles(const fs::path& sourceDir, const fs::path& target) const {
    std::vector<fs::path> result;
    fs::path targetRel = target.lexically_relative(sourceDir);
    bool targetInside = !targetRel.empty() && *targetRel.begin() != "..";

    for (const auto& rel : files.listFiles(sourceDir)) {
        if (targetInside && startsWith(rel, targetRel)) {
            continue;
        }
        result.push_back(rel);
    }
    return result;
}

SnapshotResult SnapshotCreator::run() {
    SnapshotResult result;

    m_state = State::Resolving;
    if (m_settings.startVersion < 0) {
        return fail(result, ErrorCode::InvalidSettings,
                    "Start version must not be negative: " + std::to_string(m_settings.startVersion));
    }
    VersionResolver resolver(m_settings);
    auto info = resolver.resolveProjectInfo(host.currentProjectPath());
    if (!info) {
        return fail(result, ErrorCode::NoProjectLoaded, "No project loaded");
    }

    VersionId next = 0;
    try {
        next = resolver.nextVersion(*info);
    } catch (const std::overflow_error& ex) {
        return fail(result, ErrorCode::VersionLimitReached, ex.what());
    }
    std::string folderName = resolver.versionFolderName(*info, next);
    fs::path target = info->parentDirectory / folderName;
    std::cout << "  → " << info->filename << ": "
              << VersionResolver::versionDisplay(info) << " -> v" << next << std::endl;

    m_state = State::ConflictCheck;
    if (files.exists(target)) {
        ConflictResolver conflicts(decisions, files);
        ConflictDecision decision = conflicts.decideSnapshotConflict(info->parentDirectory, folderName);

        switch (decision.choice) {
            case SnapshotConflictChoice::Cancel:
                m_state = State::Cancelled;
                result.code = ErrorCode::OperationCancelled;
                result.folderName = folderName;
                result.targetPath = target;
                result.message = "Snapshot cancelled: " + folderName + " already exists";
                std::cout << "  ↪ " << result.message << std::endl;
                return result;
            case SnapshotConflictChoice::Alongside:
                if (decision.exhausted) {
                    return fail(result, ErrorCode::SuffixExhausted,
                                "Could not create " + folderName + " alongside the existing folder: suffixes _a to _z are all taken");
                }
                folderName += decision.suffix;
                target = info->parentDirectory / folderName;
                std::cout << "  → Creating alongside as " << folderName << std::endl;
                break;
            case SnapshotConflictChoice::Overwrite:
                // Существующие файлы не удаляются, новые пишутся поверх
                std::cout << "  → Overwriting into existing " << folderName << std::endl;
                break;
        }
    }
    result.folderName = folderName;
    result.targetPath = target;

    std::vector<fs::path> sourceFiles = collectSourceFiles(info->directory, target);
    std::size_t sourceCount = sourceFiles.size();

    m_state = State::Creating;
    std::string error;
    if (!files.createDirectories(target, error)) {
        return fail(result, ErrorCode::DirectoryCreateFailed, "Could not create version folder " + target.string() + ": " + error);
    }

    m_state = State::Copying;
    std::size_t copied = 0;
    std::size_t toCopy = 0;
    for (const auto& rel : sourceFiles) {
        fs::path from = info->directory / rel;
        if (from == info->fullPath) {
            continue; // проект будет сохранён заново
        }
        ++toCopy;

        fs::path to = target / rel;
        error.clear();
        if (rel.has_parent_path() && !files.createDirectories(to.parent_path(), error)) {
            result.details.push_back(rel.string() + ": " + error);
            continue;
        }
        if (files.copyFile(from, to, error)) {
            ++copied;
        } else {
            result.details.push_back(rel.string() + ": " + error);
        }
    }
    std::cout << "  → Copied " << copied << " of " << toCopy << " files to " << target.string() << std::endl;
    if (!result.details.empty()) {
        result.fileCount = copied;
        std::ostringstream msg;
        msg << "Copy to " << folderName << " failed: copied " << copied << " of " << toCopy
            << " files, " << result.details.size() << " errors";
        return fail(result, ErrorCode::CopyFailed, msg.str());
    }

    m_state = State::Saving;
    fs::path newProject = target / (folderName + info->extension);
    error.clear();
    if (!host.saveProjectAs(newProject, error)) {
        result.fileCount = copied;
        return fail(result, ErrorCode::SaveFailed,
                    "Copied " + std::to_string(copied) + " files to " + folderName +
                    " but the project could not be saved there: " + error);
    }

    m_state = State::Verifying;
    std::vector<std::string> reasons;
    if (!files.isDirectory(target)) {
        reasons.push_back("version folder missing: " + target.string());
    }
    if (!files.isFile(newProject)) {
        reasons.push_back("project file missing: " + newProject.string());
    }
    std::size_t found = files.countFiles(target);
    result.fileCount = found;
    if (found < sourceCount) {
        reasons.push_back("file count mismatch: expected at least " + std::to_string(sourceCount) +
                          ", found " + std::to_string(found));
    }
    if (!reasons.empty()) {
        result.details = reasons;
        return fail(result, ErrorCode::VerificationFailed,
                    "Verification failed for " + folderName + ": " + join(reasons, "; ") +
                    ". Files were written to " + target.string() +
                    " and were NOT removed; check or delete that folder manually.");
    }

    m_state = State::Done;
    result.code = ErrorCode::Ok;
    result.message = "Created version " + folderName + " (" + std::to_string(found) + " files)";
    std::cout << "  ✔ " << result.message << std::endl;
    return result;
}
