#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// 0 = исходная папка без суффикса
using VersionId = std::int64_t;

struct VersionEntry {
    std::string name;
    VersionId version = 0;
    std::filesystem::path path;
};

struct ProjectInfo {
    std::filesystem::path fullPath;
    std::filesystem::path directory;
    std::filesystem::path parentDirectory;
    std::string filename;
    std::string stem;       // имя файла без расширения, с суффиксом версии
    std::string baseName;   // без суффикса версии
    std::string extension;  // с точкой, может быть пустым
    std::optional<VersionId> currentVersion;
};
