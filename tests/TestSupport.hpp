#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <utility>

#include "ProjectHost.hpp"

namespace testsupport {

namespace fs = std::filesystem;

inline fs::path uniqueTempPath(const std::string& tag) {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    return fs::temp_directory_path() /
           ("versionvault_" + tag + "_" + std::to_string(rd()) + "_" + std::to_string(counter++));
}

inline void writeFile(const fs::path& path, const std::string& content = "data") {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Временная папка на тест, удаляется в TearDown
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = uniqueTempPath("test");
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

// Хост, у которого "Сохранить как" можно заставить упасть
class FakeProjectHost : public ProjectHost {
public:
    explicit FakeProjectHost(std::optional<fs::path> project, bool saveSucceeds = true)
        : project(std::move(project)), saveSucceeds(saveSucceeds) {}

    std::optional<fs::path> currentProjectPath() const override { return project; }

    bool saveProjectAs(const fs::path& newPath, std::string& error) override {
        ++saveCalls;
        if (!saveSucceeds) {
            error = "host refused to save";
            return false;
        }
        writeFile(newPath, "<PROJECT>");
        project = newPath;
        return true;
    }

    std::optional<fs::path> project;
    bool saveSucceeds;
    int saveCalls = 0;
};

} // namespace testsupport
