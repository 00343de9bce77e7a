#pragma once

#include <iostream>

#include "DecisionProvider.hpp"

// Блокирующий запрос в консоли. Конец ввода = отмена.
class ConsoleDecisionProvider : public DecisionProvider {
public:
    ConsoleDecisionProvider(std::istream& in = std::cin, std::ostream& out = std::cout);

    SnapshotConflictChoice decideSnapshotConflict(const std::filesystem::path& targetPath) override;
    ArchiveConflictChoice decideArchiveConflict(const std::string& existingName) override;
    bool confirmArchive(const std::vector<VersionEntry>& entries,
                        const std::filesystem::path& destination) override;

private:
    bool readAnswer(std::string& answer);

    std::istream& in;
    std::ostream& out;
};
