#pragma once

#include <filesystem>
#include <optional>
#include <string>

// Приложение-хозяин проекта: даёт путь к текущему проекту и умеет "Сохранить как"
class ProjectHost {
public:
    virtual ~ProjectHost() = default;

    virtual std::optional<std::filesystem::path> currentProjectPath() const = 0;
    virtual bool saveProjectAs(const std::filesystem::path& newPath, std::string& error) = 0;
};

// Проект = один файл на диске. saveProjectAs копирует его и делает копию активным проектом.
class FileProjectHost : public ProjectHost {
public:
    FileProjectHost() = default;
    explicit FileProjectHost(std::filesystem::path projectFile);

    std::optional<std::filesystem::path> currentProjectPath() const override;
    bool saveProjectAs(const std::filesystem::path& newPath, std::string& error) override;

private:
    std::optional<std::filesystem::path> m_projectFile;
};
