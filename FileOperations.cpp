// FileOperations.cpp
#include "FileOperations.hpp"
#include <system_error>

namespace fs = std::filesystem;

bool FileOperations::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileOperations::isDirectory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool FileOperations::isFile(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileOperations::createDirectories(const fs::path& path, std::string& error) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        error = "could not create " + path.string() + ": " + ec.message();
        return false;
    }
    if (!fs::is_directory(path, ec)) {
        error = "not a directory after create: " + path.string();
        return false;
    }
    return true;
}

bool FileOperations::copyFile(const fs::path& from, const fs::path& to, std::string& error) {
    std::error_code ec;
    if (!fs::is_regular_file(from, ec)) {
        error = "source not found: " + from.string();
        return false;
    }
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy " + from.string() + " -> " + to.string() + " failed: " + ec.message();
        return false;
    }
    return true;
}

bool FileOperations::copyTree(const fs::path& from, const fs::path& to, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(from, ec)) {
        error = "source directory not found: " + from.string();
        return false;
    }
    fs::create_directories(to, ec);
    if (ec) {
        error = "could not create " + to.string() + ": " + ec.message();
        return false;
    }
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy " + from.string() + " -> " + to.string() + " failed: " + ec.message();
        return false;
    }
    return true;
}

bool FileOperations::removeTree(const fs::path& path, std::string& error) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        error = "could not remove " + path.string() + ": " + ec.message();
        return false;
    }
    if (fs::exists(path, ec)) {
        error = "still present after remove: " + path.string();
        return false;
    }
    return true;
}

std::vector<fs::path> FileOperations::listFiles(const fs::path& root) const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    while (!ec && it != fs::recursive_directory_iterator()) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc)) {
            files.push_back(it->path().lexically_relative(root));
        }
        it.increment(ec);
    }
    return files;
}

std::size_t FileOperations::countFiles(const fs::path& root) const {
    return listFiles(root).size();
}
