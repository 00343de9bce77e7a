#pragma once

#include <string>

// Снимок настроек, читается заново перед каждой операцией
struct Settings {
    std::string versionPrefix = "_v";
    int versionDigits = 3;
    long long startVersion = 1;
    std::string archiveDestination;
    long long versionsToKeep = 3;
    bool verifyChecksums = true;
};
