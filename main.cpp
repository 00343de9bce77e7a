#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "ArchiveMover.hpp"
#include "ArchiveSelector.hpp"
#include "ChecksumService.hpp"
#include "ConfigLoader.hpp"
#include "ConsoleDecisionProvider.hpp"
#include "FileOperations.hpp"
#include "ProjectHost.hpp"
#include "SnapshotCreator.hpp"
#include "StatePersistenceService.hpp"
#include "VersionResolver.hpp"

namespace fs = std::filesystem;

namespace {

const int kExitOk = 0;
const int kExitError = 1;
const int kExitUsage = 2;

void printUsage(std::ostream& out) {
    out << "Usage: versionvault [--config FILE] [--db FILE] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  info <project>                         show version information\n"
        << "  snapshot <project> [--on-conflict alongside|overwrite|cancel]\n"
        << "                                         copy the project into its next version folder\n"
        << "  archive <project> [--dest DIR] [--keep N] [--yes] [--on-existing skip|replace|abort]\n"
        << "                                         move old versions to the archive\n"
        << "  config list | get KEY | set KEY VALUE  persistent settings\n"
        << "  history [N]                            last N operations (default 20)\n";
}

// Значения по умолчанию <- config.json <- сохранённые в БД
Settings loadSettings(const std::string& configPath, StatePersistenceService& dbService) {
    ConfigLoader loader(configPath);
    if (fs::exists(configPath) && !loader.load()) {
        throw std::runtime_error("Could not load configuration: " + configPath);
    }
    return dbService.applyTo(loader.getSettings());
}

bool requireProjectFile(const std::string& path) {
    if (!fs::is_regular_file(path)) {
        std::cerr << "Project file not found: " << path << std::endl;
        return false;
    }
    return true;
}

void journal(StatePersistenceService& dbService, const std::string& kind, const std::string& project,
             ErrorCode code, const std::string& message) {
    OperationRecord record;
    record.kind = kind;
    record.projectPath = project;
    record.outcome = errorCodeName(code);
    record.message = message;
    try {
        dbService.recordOperation(record);
    } catch (const std::exception& ex) {
        std::cerr << "  ⚠ Could not write operation journal: " << ex.what() << std::endl;
    }
}

int runInfo(const std::vector<std::string>& args, const Settings& settings) {
    if (args.size() != 1) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (!requireProjectFile(args[0])) {
        return kExitError;
    }

    FileProjectHost host(args[0]);
    VersionResolver resolver(settings);
    auto info = resolver.resolveProjectInfo(host.currentProjectPath());

    std::cout << "Project:  " << VersionResolver::projectDisplay(info) << std::endl;
    std::cout << "Version:  " << VersionResolver::versionDisplay(info) << std::endl;
    if (!info) {
        return kExitError;
    }

    std::cout << "Folder:   " << info->parentDirectory.string() << std::endl;
    try {
        VersionId next = resolver.nextVersion(*info);
        std::cout << "Next:     " << resolver.versionFolderName(*info, next) << std::endl;
    } catch (const std::overflow_error& ex) {
        std::cout << "Next:     none (" << ex.what() << ")" << std::endl;
    }

    auto versions = resolver.listVersions(info->parentDirectory, info->baseName);
    auto candidates = ArchiveSelector::versionsToArchive(info->currentVersion.value_or(0),
                                                         settings.versionsToKeep, versions);
    std::cout << "Versions: " << versions.size() << std::endl;
    for (const auto& entry : versions) {
        bool archivable = false;
        for (const auto& candidate : candidates) {
            archivable = archivable || candidate.version == entry.version;
        }
        std::cout << "  " << entry.name << (entry.version == 0 ? " (v0 - original)" : "")
                  << (archivable ? "  [archivable]" : "") << std::endl;
    }
    return kExitOk;
}

int runSnapshot(const std::vector<std::string>& args, const Settings& settings, StatePersistenceService& dbService) {
    std::string project;
    std::unique_ptr<DecisionProvider> decisions;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--on-conflict" && i + 1 < args.size()) {
            SnapshotConflictChoice choice;
            if (!parseSnapshotChoice(args[++i], choice)) {
                std::cerr << "Unknown conflict choice: " << args[i] << std::endl;
                return kExitUsage;
            }
            decisions = std::make_unique<ScriptedDecisionProvider>(choice);
        } else if (project.empty()) {
            project = args[i];
        } else {
            printUsage(std::cerr);
            return kExitUsage;
        }
    }
    if (project.empty()) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (!requireProjectFile(project)) {
        return kExitError;
    }
    if (!decisions) {
        decisions = std::make_unique<ConsoleDecisionProvider>();
    }

    FileProjectHost host(project);
    FileOperations files;
    SnapshotCreator creator(settings, host, *decisions, files);
    SnapshotResult result = creator.create();

    std::cout << result.message << std::endl;
    for (const auto& detail : result.details) {
        std::cout << "  - " << detail << std::endl;
    }
    journal(dbService, "snapshot", project, result.code, result.message);
    return result.isError() ? kExitError : kExitOk;
}

int runArchive(const std::vector<std::string>& args, Settings settings, StatePersistenceService& dbService) {
    std::string project;
    bool assumeYes = false;
    bool haveExistingChoice = false;
    ArchiveConflictChoice existingChoice = ArchiveConflictChoice::Abort;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--dest" && i + 1 < args.size()) {
            settings.archiveDestination = args[++i];
        } else if (args[i] == "--keep" && i + 1 < args.size()) {
            try {
                settings.versionsToKeep = std::stoll(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "--keep expects a number, got: " << args[i] << std::endl;
                return kExitUsage;
            }
        } else if (args[i] == "--yes") {
            assumeYes = true;
        } else if (args[i] == "--on-existing" && i + 1 < args.size()) {
            if (!parseArchiveChoice(args[++i], existingChoice)) {
                std::cerr << "Unknown existing-archive choice: " << args[i] << std::endl;
                return kExitUsage;
            }
            haveExistingChoice = true;
        } else if (project.empty()) {
            project = args[i];
        } else {
            printUsage(std::cerr);
            return kExitUsage;
        }
    }
    if (project.empty()) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (haveExistingChoice && !assumeYes) {
        std::cerr << "--on-existing requires --yes" << std::endl;
        return kExitUsage;
    }
    if (!requireProjectFile(project)) {
        return kExitError;
    }

    std::unique_ptr<DecisionProvider> decisions;
    if (assumeYes) {
        decisions = std::make_unique<ScriptedDecisionProvider>(SnapshotConflictChoice::Cancel, existingChoice, true);
    } else {
        decisions = std::make_unique<ConsoleDecisionProvider>();
    }

    FileProjectHost host(project);
    FileOperations files;
    ChecksumService checksum;
    ArchiveMover mover(*decisions, files, checksum, settings.verifyChecksums);
    ArchiveResult result = mover.run(host, settings);

    std::cout << result.message << std::endl;
    journal(dbService, "archive", project, result.code, result.message);
    return result.isError() ? kExitError : kExitOk;
}

int runConfig(const std::vector<std::string>& args, const Settings& settings, StatePersistenceService& dbService) {
    if (args.empty()) {
        printUsage(std::cerr);
        return kExitUsage;
    }

    if (args[0] == "list" && args.size() == 1) {
        std::cout << "version_prefix      = " << settings.versionPrefix << "\n"
                  << "version_digits      = " << settings.versionDigits << "\n"
                  << "start_version       = " << settings.startVersion << "\n"
                  << "archive_destination = " << settings.archiveDestination << "\n"
                  << "versions_to_keep    = " << settings.versionsToKeep << "\n"
                  << "verify_checksums    = " << (settings.verifyChecksums ? "true" : "false") << std::endl;
        return kExitOk;
    }
    if (args[0] == "get" && args.size() == 2) {
        auto value = dbService.getSetting(args[1]);
        if (!value) {
            std::cerr << "Not set: " << args[1] << std::endl;
            return kExitError;
        }
        std::cout << *value << std::endl;
        return kExitOk;
    }
    if (args[0] == "set" && args.size() == 3) {
        try {
            dbService.setSetting(args[1], args[2]);
        } catch (const std::invalid_argument& ex) {
            std::cerr << ex.what() << std::endl;
            return kExitError;
        }
        std::cout << "  ✔ " << args[1] << " = " << args[2] << std::endl;
        return kExitOk;
    }

    printUsage(std::cerr);
    return kExitUsage;
}

int runHistory(const std::vector<std::string>& args, StatePersistenceService& dbService) {
    int limit = 20;
    if (!args.empty()) {
        try {
            limit = std::stoi(args[0]);
        } catch (const std::exception&) {
            std::cerr << "history expects a number, got: " << args[0] << std::endl;
            return kExitUsage;
        }
    }

    for (const auto& record : dbService.recentOperations(limit)) {
        auto t = std::chrono::system_clock::to_time_t(record.timestamp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::cout << std::put_time(&tm, "%F %T") << "  " << record.kind << "  " << record.outcome
                  << "  " << record.projectPath << "\n    " << record.message << std::endl;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config.json";
    std::string dbPath = "versionvault.db";

    std::vector<std::string> args(argv + 1, argv + argc);
    std::size_t pos = 0;
    while (pos < args.size() && args[pos].rfind("--", 0) == 0) {
        if (args[pos] == "--config" && pos + 1 < args.size()) {
            configPath = args[pos + 1];
            pos += 2;
        } else if (args[pos] == "--db" && pos + 1 < args.size()) {
            dbPath = args[pos + 1];
            pos += 2;
        } else if (args[pos] == "--help") {
            printUsage(std::cout);
            return kExitOk;
        } else {
            printUsage(std::cerr);
            return kExitUsage;
        }
    }
    if (pos >= args.size()) {
        printUsage(std::cerr);
        return kExitUsage;
    }

    const std::string command = args[pos];
    std::vector<std::string> rest(args.begin() + pos + 1, args.end());

    try {
        StatePersistenceService dbService(dbPath);
        dbService.initializeSchema();
        Settings settings = loadSettings(configPath, dbService);

        if (command == "info") return runInfo(rest, settings);
        if (command == "snapshot") return runSnapshot(rest, settings, dbService);
        if (command == "archive") return runArchive(rest, settings, dbService);
        if (command == "config") return runConfig(rest, settings, dbService);
        if (command == "history") return runHistory(rest, dbService);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        return kExitError;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage(std::cerr);
    return kExitUsage;
}
