#pragma once

#include <filesystem>
#include <string>
#include <vector>

class DirectoryScanner {
public:
    // Имена непосредственных подпапок parent. Пустой список, если parent нет или он недоступен.
    std::vector<std::string> listSiblings(const std::filesystem::path& parent) const;
};
