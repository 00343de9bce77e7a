// ConfigLoader.h
#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "Settings.hpp"

class ConfigLoader {
public:
    explicit ConfigLoader(const std::string& configPath);

    bool load(); // Загрузка конфига; при ошибке настройки остаются прежними
    const Settings& getSettings() const;

    // Начальные значения, поверх которых читается файл
    void setDefaults(const Settings& defaults);

    static Settings parse(const nlohmann::json& root, const Settings& base);

private:
    std::string m_configPath;
    Settings m_settings;
};
