// ProjectHost.cpp
#include "ProjectHost.hpp"
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

FileProjectHost::FileProjectHost(fs::path projectFile)
    : m_projectFile(std::move(projectFile)) {}

std::optional<fs::path> FileProjectHost::currentProjectPath() const {
    return m_projectFile;
}

bool FileProjectHost::saveProjectAs(const fs::path& newPath, std::string& error) {
    if (!m_projectFile) {
        error = "No project loaded";
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(*m_projectFile, ec)) {
        error = "project file not found: " + m_projectFile->string();
        return false;
    }
    if (newPath.has_parent_path()) {
        fs::create_directories(newPath.parent_path(), ec);
        if (ec) {
            error = "could not create " + newPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    fs::copy_file(*m_projectFile, newPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "save as " + newPath.string() + " failed: " + ec.message();
        return false;
    }

    m_projectFile = newPath;
    return true;
}
