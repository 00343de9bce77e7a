/**
 * @file test_conflict_resolver.cpp
 * @brief Unit tests for ConflictResolver and ScriptedDecisionProvider
 */

#include <gtest/gtest.h>

#include "ConflictResolver.hpp"
#include "TestSupport.hpp"

namespace fs = std::filesystem;

class ConflictResolverTest : public testsupport::TempDirTest {
protected:
    FileOperations files;
};

TEST_F(ConflictResolverTest, AlongsideTakesFirstFreeSuffix) {
    fs::create_directories(root / "Song_v002");
    fs::create_directories(root / "Song_v002_a");

    ScriptedDecisionProvider decisions(SnapshotConflictChoice::Alongside);
    ConflictResolver resolver(decisions, files);
    ConflictDecision decision = resolver.decideSnapshotConflict(root, "Song_v002");

    EXPECT_EQ(decision.choice, SnapshotConflictChoice::Alongside);
    EXPECT_FALSE(decision.exhausted);
    EXPECT_EQ(decision.suffix, "_b");
    ASSERT_EQ(decisions.askedAbout().size(), 1u);
    EXPECT_EQ(decisions.askedAbout()[0], "Song_v002");
}

TEST_F(ConflictResolverTest, AlongsideWithNoSiblingsUsesA) {
    fs::create_directories(root / "Song_v002");
    ScriptedDecisionProvider decisions(SnapshotConflictChoice::Alongside);
    ConflictResolver resolver(decisions, files);
    EXPECT_EQ(resolver.findAlongsideSuffix(root, "Song_v002").value_or(""), "_a");
}

TEST_F(ConflictResolverTest, AlongsideExhaustedAfterZ) {
    fs::create_directories(root / "Song_v002");
    for (char letter = 'a'; letter <= 'z'; ++letter) {
        fs::create_directories(root / (std::string("Song_v002_") + letter));
    }

    ScriptedDecisionProvider decisions(SnapshotConflictChoice::Alongside);
    ConflictResolver resolver(decisions, files);
    ConflictDecision decision = resolver.decideSnapshotConflict(root, "Song_v002");

    EXPECT_EQ(decision.choice, SnapshotConflictChoice::Alongside);
    EXPECT_TRUE(decision.exhausted);
    EXPECT_TRUE(decision.suffix.empty());
}

TEST_F(ConflictResolverTest, OverwriteAndCancelCarryNoSuffix) {
    fs::create_directories(root / "Song_v002");

    ScriptedDecisionProvider decisions;
    decisions.queueSnapshotChoice(SnapshotConflictChoice::Overwrite);
    decisions.queueSnapshotChoice(SnapshotConflictChoice::Cancel);
    ConflictResolver resolver(decisions, files);

    ConflictDecision first = resolver.decideSnapshotConflict(root, "Song_v002");
    EXPECT_EQ(first.choice, SnapshotConflictChoice::Overwrite);
    EXPECT_TRUE(first.suffix.empty());

    ConflictDecision second = resolver.decideSnapshotConflict(root, "Song_v002");
    EXPECT_EQ(second.choice, SnapshotConflictChoice::Cancel);
    EXPECT_TRUE(second.suffix.empty());
}

TEST_F(ConflictResolverTest, ArchiveDecisionComesFromProvider) {
    ScriptedDecisionProvider decisions(SnapshotConflictChoice::Cancel, ArchiveConflictChoice::Skip);
    decisions.queueArchiveChoice(ArchiveConflictChoice::Replace);
    ConflictResolver resolver(decisions, files);

    EXPECT_EQ(resolver.decideArchiveConflict("Song_v001"), ArchiveConflictChoice::Replace);
    EXPECT_EQ(resolver.decideArchiveConflict("Song_v002"), ArchiveConflictChoice::Skip);
}

TEST(DecisionParsingTest, ParsesChoiceNames) {
    SnapshotConflictChoice snapshot;
    EXPECT_TRUE(parseSnapshotChoice("Alongside", snapshot));
    EXPECT_EQ(snapshot, SnapshotConflictChoice::Alongside);
    EXPECT_TRUE(parseSnapshotChoice("o", snapshot));
    EXPECT_EQ(snapshot, SnapshotConflictChoice::Overwrite);
    EXPECT_FALSE(parseSnapshotChoice("later", snapshot));

    ArchiveConflictChoice archive;
    EXPECT_TRUE(parseArchiveChoice("skip", archive));
    EXPECT_EQ(archive, ArchiveConflictChoice::Skip);
    EXPECT_TRUE(parseArchiveChoice("ABORT", archive));
    EXPECT_EQ(archive, ArchiveConflictChoice::Abort);
    EXPECT_FALSE(parseArchiveChoice("", archive));
}
