#include "ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "nlohmann/json.hpp"

ConfigLoader::ConfigLoader(const std::string& configPath)
    : m_configPath(configPath) {}

void ConfigLoader::setDefaults(const Settings& defaults) {
    m_settings = defaults;
}

bool ConfigLoader::load() {
    std::ifstream file(m_configPath);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json root;
    try {
        file >> root;
        m_settings = parse(root, m_settings);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[ConfigLoader] " << m_configPath << ": " << ex.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[ConfigLoader] " << m_configPath << ": " << ex.what() << std::endl;
        return false;
    }

    return true;
}

Settings ConfigLoader::parse(const nlohmann::json& root, const Settings& base) {
    Settings settings = base;

    if (root.contains("versioning")) {
        const auto& versioning = root.at("versioning");
        settings.versionPrefix = versioning.value("prefix", settings.versionPrefix);
        settings.versionDigits = versioning.value("digits", settings.versionDigits);
        settings.startVersion = versioning.value("start_version", settings.startVersion);
    }

    if (root.contains("archive")) {
        const auto& archive = root.at("archive");
        settings.archiveDestination = archive.value("destination", settings.archiveDestination);
        settings.versionsToKeep = archive.value("versions_to_keep", settings.versionsToKeep);
        settings.verifyChecksums = archive.value("verify_checksums", settings.verifyChecksums);
    }

    if (settings.versionDigits < 1) {
        throw std::invalid_argument("versioning.digits must be >= 1");
    }
    if (settings.startVersion < 0) {
        throw std::invalid_argument("versioning.start_version must be >= 0");
    }
    return settings;
}

const Settings& ConfigLoader::getSettings() const {
    return m_settings;
}
