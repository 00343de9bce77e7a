// ConsoleDecisionProvider.cpp
#include "ConsoleDecisionProvider.hpp"
#include <string>

ConsoleDecisionProvider::ConsoleDecisionProvider(std::istream& in, std::ostream& out)
    : in(in), out(out) {}

bool ConsoleDecisionProvider::readAnswer(std::string& answer) {
    if (!std::getline(in, answer)) {
        return false;
    }
    // убираем пробелы по краям
    auto first = answer.find_first_not_of(" \t\r");
    auto last = answer.find_last_not_of(" \t\r");
    answer = first == std::string::npos ? std::string() : answer.substr(first, last - first + 1);
    return true;
}

SnapshotConflictChoice ConsoleDecisionProvider::decideSnapshotConflict(const std::filesystem::path& targetPath) {
    std::string answer;
    while (true) {
        out << "\"" << targetPath.string() << "\" already exists.\n"
            << "  [a]longside - create a new folder with a letter suffix\n"
            << "  [o]verwrite - copy over the existing folder (old files are kept)\n"
            << "  [c]ancel\n"
            << "> " << std::flush;
        if (!readAnswer(answer)) {
            return SnapshotConflictChoice::Cancel;
        }
        SnapshotConflictChoice choice;
        if (parseSnapshotChoice(answer, choice)) {
            return choice;
        }
    }
}

ArchiveConflictChoice ConsoleDecisionProvider::decideArchiveConflict(const std::string& existingName) {
    std::string answer;
    while (true) {
        out << "\"" << existingName << "\" already exists in archive.\n"
            << "  [s]kip this version\n"
            << "  [r]eplace existing archive\n"
            << "  [a]bort entire operation\n"
            << "> " << std::flush;
        if (!readAnswer(answer)) {
            return ArchiveConflictChoice::Abort;
        }
        ArchiveConflictChoice choice;
        if (parseArchiveChoice(answer, choice)) {
            return choice;
        }
    }
}

bool ConsoleDecisionProvider::confirmArchive(const std::vector<VersionEntry>& entries,
                                             const std::filesystem::path& destination) {
    out << "Archive and REMOVE the following versions from source?\n\n";
    for (const auto& entry : entries) {
        out << "  • " << entry.name;
        if (entry.version == 0) {
            out << " (v0 - original)";
        }
        out << "\n";
    }
    out << "\nDestination: " << destination.string() << "\n\nThis action cannot be undone.\n";

    std::string answer;
    while (true) {
        out << "[y/n]> " << std::flush;
        if (!readAnswer(answer)) {
            return false;
        }
        if (answer == "y" || answer == "Y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "N" || answer == "no") {
            return false;
        }
    }
}
