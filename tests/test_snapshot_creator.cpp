/**
 * @file test_snapshot_creator.cpp
 * @brief Unit tests for SnapshotCreator
 */

#include <gtest/gtest.h>

#include "SnapshotCreator.hpp"
#include "TestSupport.hpp"

using testsupport::FakeProjectHost;
using testsupport::readFile;
using testsupport::writeFile;
namespace fs = std::filesystem;

namespace {

// copyFile "успешен", но ничего не пишет
class NoOpCopyFiles : public FileOperations {
public:
    bool copyFile(const fs::path&, const fs::path&, std::string&) override { return true; }
};

class FailingCopyFiles : public FileOperations {
public:
    explicit FailingCopyFiles(std::string failName) : failName(std::move(failName)) {}

    bool copyFile(const fs::path& from, const fs::path& to, std::string& error) override {
        if (from.filename() == failName) {
            error = "permission denied";
            return false;
        }
        return FileOperations::copyFile(from, to, error);
    }

    std::string failName;
};

class NoCreateFiles : public FileOperations {
public:
    bool createDirectories(const fs::path&, std::string& error) override {
        error = "disk full";
        return false;
    }
};

} // namespace

class SnapshotCreatorTest : public testsupport::TempDirTest {
protected:
    // <root>/<name>/<name>.rpp + 4 файла проекта
    fs::path makeProject(const std::string& name) {
        fs::path dir = root / name;
        writeFile(dir / (name + ".rpp"), "<PROJECT " + name + ">");
        writeFile(dir / "Audio" / "kick.wav", "kick");
        writeFile(dir / "Audio" / "snare.wav", "snare");
        writeFile(dir / "Audio" / "bass.wav", "bass");
        writeFile(dir / "notes.txt", "notes");
        return dir / (name + ".rpp");
    }

    Settings settings;
    FileOperations files;
    ScriptedDecisionProvider decisions;
};

// ============================================================================
// Successful snapshots
// ============================================================================

TEST_F(SnapshotCreatorTest, CreatesFirstVersionBesideProject) {
    FileProjectHost host(makeProject("Song"));
    SnapshotCreator creator(settings, host, decisions, files);

    SnapshotResult result = creator.create();

    ASSERT_TRUE(result.succeeded()) << result.message;
    EXPECT_EQ(creator.state(), SnapshotCreator::State::Done);
    EXPECT_EQ(result.folderName, "Song_v001");
    EXPECT_EQ(result.targetPath, root / "Song_v001");
    EXPECT_EQ(result.fileCount, 5u);
    EXPECT_EQ(result.message, "Created version Song_v001 (5 files)");

    fs::path target = root / "Song_v001";
    EXPECT_TRUE(fs::is_regular_file(target / "Song_v001.rpp"));
    EXPECT_FALSE(fs::exists(target / "Song.rpp"));
    EXPECT_EQ(readFile(target / "Audio" / "kick.wav"), "kick");
    EXPECT_EQ(readFile(target / "notes.txt"), "notes");
    EXPECT_EQ(host.currentProjectPath().value(), target / "Song_v001.rpp");
}

TEST_F(SnapshotCreatorTest, ContinuesAfterExistingSiblingVersion) {
    FileProjectHost host(makeProject("Song"));
    fs::create_directories(root / "Song_v001");

    SnapshotCreator creator(settings, host, decisions, files);
    SnapshotResult result = creator.create();

    ASSERT_TRUE(result.succeeded()) << result.message;
    EXPECT_EQ(result.folderName, "Song_v002");
    EXPECT_TRUE(fs::is_regular_file(root / "Song_v002" / "Song_v002.rpp"));
}

TEST_F(SnapshotCreatorTest, SecondSnapshotIncrementsFromActiveVersion) {
    FileProjectHost host(makeProject("Song"));
    SnapshotCreator creator(settings, host, decisions, files);

    ASSERT_TRUE(creator.create().succeeded());
    SnapshotResult second = creator.create();

    ASSERT_TRUE(second.succeeded()) << second.message;
    EXPECT_EQ(second.folderName, "Song_v002");
    EXPECT_EQ(readFile(root / "Song_v002" / "Audio" / "bass.wav"), "bass");
}

// ============================================================================
// Conflicts
// ============================================================================

TEST_F(SnapshotCreatorTest, CancelOnExistingTarget) {
    FileProjectHost host(makeProject("Song_v001"));
    fs::create_directories(root / "Song_v002");

    SnapshotCreator creator(settings, host, decisions, files);
    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::OperationCancelled);
    EXPECT_FALSE(result.isError());
    EXPECT_FALSE(result.message.empty());
    EXPECT_EQ(creator.state(), SnapshotCreator::State::Cancelled);
    EXPECT_TRUE(fs::is_empty(root / "Song_v002"));
}

TEST_F(SnapshotCreatorTest, AlongsideUsesNextFreeSuffix) {
    FileProjectHost host(makeProject("Song_v001"));
    fs::create_directories(root / "Song_v002");
    fs::create_directories(root / "Song_v002_a");

    ScriptedDecisionProvider alongside(SnapshotConflictChoice::Alongside);
    SnapshotCreator creator(settings, host, alongside, files);
    SnapshotResult result = creator.create();

    ASSERT_TRUE(result.succeeded()) << result.message;
    EXPECT_EQ(result.folderName, "Song_v002_b");
    EXPECT_TRUE(fs::is_regular_file(root / "Song_v002_b" / "Song_v002_b.rpp"));
}

TEST_F(SnapshotCreatorTest, AlongsideFailsWhenSuffixesExhausted) {
    FileProjectHost host(makeProject("Song_v001"));
    fs::create_directories(root / "Song_v002");
    for (char letter = 'a'; letter <= 'z'; ++letter) {
        fs::create_directories(root / (std::string("Song_v002_") + letter));
    }

    ScriptedDecisionProvider alongside(SnapshotConflictChoice::Alongside);
    SnapshotCreator creator(settings, host, alongside, files);
    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::SuffixExhausted);
    EXPECT_TRUE(result.isError());
}

TEST_F(SnapshotCreatorTest, OverwriteKeepsStaleFiles) {
    FileProjectHost host(makeProject("Song_v001"));
    writeFile(root / "Song_v002" / "stale.txt", "old");

    ScriptedDecisionProvider overwrite(SnapshotConflictChoice::Overwrite);
    SnapshotCreator creator(settings, host, overwrite, files);
    SnapshotResult result = creator.create();

    ASSERT_TRUE(result.succeeded()) << result.message;
    EXPECT_EQ(readFile(root / "Song_v002" / "stale.txt"), "old");
    EXPECT_EQ(readFile(root / "Song_v002" / "Audio" / "kick.wav"), "kick");
    EXPECT_EQ(result.fileCount, 6u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(SnapshotCreatorTest, NoProjectLoaded) {
    FileProjectHost host;
    SnapshotCreator creator(settings, host, decisions, files);
    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::NoProjectLoaded);
    EXPECT_EQ(result.message, "No project loaded");
    EXPECT_EQ(creator.state(), SnapshotCreator::State::Failed);
}

TEST_F(SnapshotCreatorTest, VersionLimitReachedCreatesNothing) {
    FileProjectHost host(makeProject("Song_v9223372036854775807"));
    SnapshotCreator creator(settings, host, decisions, files);

    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::VersionLimitReached);
    EXPECT_NE(result.message.find("Version limit reached"), std::string::npos) << result.message;
    EXPECT_EQ(creator.state(), SnapshotCreator::State::Failed);
    EXPECT_EQ(std::distance(fs::directory_iterator(root), fs::directory_iterator()), 1);
}

TEST_F(SnapshotCreatorTest, VerificationFailsWhenNothingWasCopied) {
    FileProjectHost host(makeProject("Song"));
    NoOpCopyFiles noCopy;
    SnapshotCreator creator(settings, host, decisions, noCopy);

    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::VerificationFailed);
    EXPECT_NE(result.message.find("file count mismatch: expected at least 5, found 1"), std::string::npos);
    EXPECT_NE(result.message.find("NOT removed"), std::string::npos);
    ASSERT_EQ(result.details.size(), 1u);
    EXPECT_TRUE(fs::is_directory(root / "Song_v001"));
    EXPECT_TRUE(fs::is_regular_file(root / "Song_v001" / "Song_v001.rpp"));
}

TEST_F(SnapshotCreatorTest, CopyErrorsAreCollectedAndFailTheStep) {
    FakeProjectHost host(makeProject("Song"));
    FailingCopyFiles failing("snare.wav");
    SnapshotCreator creator(settings, host, decisions, failing);

    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::CopyFailed);
    EXPECT_NE(result.message.find("copied 3 of 4 files, 1 errors"), std::string::npos);
    ASSERT_EQ(result.details.size(), 1u);
    EXPECT_NE(result.details[0].find("snare.wav"), std::string::npos);
    EXPECT_EQ(host.saveCalls, 0);
}

TEST_F(SnapshotCreatorTest, DirectoryCreateFailure) {
    FileProjectHost host(makeProject("Song"));
    NoCreateFiles noCreate;
    SnapshotCreator creator(settings, host, decisions, noCreate);

    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::DirectoryCreateFailed);
    EXPECT_NE(result.message.find("disk full"), std::string::npos);
}

TEST_F(SnapshotCreatorTest, HostSaveFailure) {
    FakeProjectHost host(makeProject("Song"), false);
    SnapshotCreator creator(settings, host, decisions, files);

    SnapshotResult result = creator.create();

    EXPECT_EQ(result.code, ErrorCode::SaveFailed);
    EXPECT_NE(result.message.find("host refused to save"), std::string::npos);
    EXPECT_EQ(host.saveCalls, 1);
}

TEST_F(SnapshotCreatorTest, InvalidSettingsReported) {
    FileProjectHost host(makeProject("Song"));

    settings.versionDigits = 0;
    SnapshotCreator badDigits(settings, host, decisions, files);
    EXPECT_EQ(badDigits.create().code, ErrorCode::InvalidSettings);

    settings.versionDigits = 3;
    settings.startVersion = -1;
    SnapshotCreator badStart(settings, host, decisions, files);
    EXPECT_EQ(badStart.create().code, ErrorCode::InvalidSettings);
}
