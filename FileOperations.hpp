#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Обёртка над std::filesystem. Методы виртуальные, чтобы в тестах можно было подменить сбои.
class FileOperations {
public:
    virtual ~FileOperations() = default;

    virtual bool exists(const std::filesystem::path& path) const;
    virtual bool isDirectory(const std::filesystem::path& path) const;
    virtual bool isFile(const std::filesystem::path& path) const;

    virtual bool createDirectories(const std::filesystem::path& path, std::string& error);
    virtual bool copyFile(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error);
    virtual bool copyTree(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error);
    virtual bool removeTree(const std::filesystem::path& path, std::string& error);

    // Все обычные файлы под root (рекурсивно), пути относительно root
    virtual std::vector<std::filesystem::path> listFiles(const std::filesystem::path& root) const;
    std::size_t countFiles(const std::filesystem::path& root) const;
};
