// File: tests/run/checkpoint_test.cpp
#include "run/checkpoint.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace simgroup {
namespace {

RunCheckpoint MakeCheckpoint() {
    RunCheckpoint checkpoint;
    checkpoint.file_list_hash = HashFileList({"a.png", "b.png", "c.png"});
    checkpoint.assignment[0] = GroupMember{3, 0.95f};
    checkpoint.assignment[2] = GroupMember{3, 0.91f};
    checkpoint.membership[3]["a.png"] = 0.95f;
    checkpoint.membership[3]["c.png"] = 0.91f;
    checkpoint.next_group_id = 4;
    checkpoint.next_position = 2;
    checkpoint.duplicates.emplace_back("a.png", "c.png");
    return checkpoint;
}

TEST(RunCheckpointTest, SerializeRoundTrip) {
    RunCheckpoint original = MakeCheckpoint();

    RunCheckpoint restored = RunCheckpoint::Deserialize(original.Serialize());

    EXPECT_EQ(original, restored);
    EXPECT_FALSE(restored.is_complete);
    EXPECT_EQ(2u, restored.next_position);
}

TEST(RunCheckpointTest, EmptyCheckpointRoundTrip) {
    RunCheckpoint empty;
    empty.is_complete = true;

    EXPECT_EQ(empty, RunCheckpoint::Deserialize(empty.Serialize()));
}

TEST(RunCheckpointTest, BadMagicThrows) {
    Blob blob = MakeCheckpoint().Serialize();
    blob[0] = 'X';

    EXPECT_THROW(RunCheckpoint::Deserialize(blob), CheckpointFormatError);
    EXPECT_THROW(RunCheckpoint::Deserialize(Blob{}), CheckpointFormatError);
}

TEST(RunCheckpointTest, UnknownVersionThrows) {
    Blob blob = MakeCheckpoint().Serialize();
    // Version follows the 4-byte magic
    blob[4] = static_cast<uint8_t>(RunCheckpoint::kVersion + 1);

    EXPECT_THROW(RunCheckpoint::Deserialize(blob), CheckpointFormatError);
}

TEST(RunCheckpointTest, TruncationThrows) {
    Blob blob = MakeCheckpoint().Serialize();
    blob.resize(blob.size() - 3);

    EXPECT_THROW(RunCheckpoint::Deserialize(blob), CheckpointFormatError);
}

TEST(RunCheckpointTest, IndicesWithinBounds) {
    RunCheckpoint checkpoint = MakeCheckpoint();

    EXPECT_TRUE(checkpoint.IndicesWithinBounds(3));
    EXPECT_FALSE(checkpoint.IndicesWithinBounds(2));
    EXPECT_TRUE(RunCheckpoint().IndicesWithinBounds(0));
}

TEST(RunCheckpointTest, InequalityOnAnyField) {
    RunCheckpoint a = MakeCheckpoint();
    RunCheckpoint b = MakeCheckpoint();
    b.next_position = 3;

    EXPECT_NE(a, b);
}

} // namespace
} // namespace simgroup
