#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

class ChecksumService {
public:
    // SHA-256 файла в hex
    static std::string compute(const std::filesystem::path& filePath);

    // относительный путь -> хеш для каждого обычного файла под root
    std::map<std::string, std::string> computeTree(const std::filesystem::path& root) const;

    // Пустой список, если destination содержит те же файлы с тем же содержимым, что и source
    std::vector<std::string> compareTrees(const std::filesystem::path& source,
                                          const std::filesystem::path& destination) const;
};
