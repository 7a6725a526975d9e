#include <gtest/gtest.h>
#include "core/PiecePlanner.hpp"
#include "core/Errors.hpp"

TEST(PiecePlannerTest, PiecesCoverFileContiguously) {
    const int64_t file_sizes[] = {1, 2, 999, 1000, 1001, 4096, 65537, 10 * 1024 * 1024 + 3};
    const int64_t piece_sizes[] = {1, 7, 1000, 4096, 1024 * 1024};

    for (int64_t file_size : file_sizes) {
        for (int64_t piece_size : piece_sizes) {
            if (file_size / piece_size > 100000) continue;
            SCOPED_TRACE("file " + std::to_string(file_size) + ", piece " + std::to_string(piece_size));

            PiecePlan plan = PiecePlanner::plan(file_size, piece_size);
            int64_t expected_count = (file_size + piece_size - 1) / piece_size;
            ASSERT_EQ(plan.get_piece_count(), expected_count);

            int64_t next_offset = 0;
            for (int i = 0; i < plan.get_piece_count(); ++i) {
                const Piece& piece = plan.pieces[i];
                EXPECT_EQ(piece.index, i);
                EXPECT_EQ(piece.offset, next_offset);
                EXPECT_GT(piece.length, 0);
                EXPECT_LE(piece.length, piece_size);
                EXPECT_EQ(piece.status, PieceStatus::Pending);
                if (i + 1 < plan.get_piece_count()) {
                    EXPECT_EQ(piece.length, piece_size);
                }
                next_offset = piece.end();
            }
            EXPECT_EQ(next_offset, file_size);
        }
    }
}

TEST(PiecePlannerTest, LastPieceTakesRemainder) {
    PiecePlan plan = PiecePlanner::plan(10, 4);
    ASSERT_EQ(plan.get_piece_count(), 3);
    EXPECT_EQ(plan.pieces[0].length, 4);
    EXPECT_EQ(plan.pieces[1].length, 4);
    EXPECT_EQ(plan.pieces[2].offset, 8);
    EXPECT_EQ(plan.pieces[2].length, 2);

    PiecePlan even = PiecePlanner::plan(8, 4);
    ASSERT_EQ(even.get_piece_count(), 2);
    EXPECT_EQ(even.pieces[1].length, 4);
}

TEST(PiecePlannerTest, PieceLargerThanFileGivesOnePiece) {
    PiecePlan plan = PiecePlanner::plan(100, 4 * 1024 * 1024);
    ASSERT_EQ(plan.get_piece_count(), 1);
    EXPECT_EQ(plan.pieces[0].offset, 0);
    EXPECT_EQ(plan.pieces[0].length, 100);
}

TEST(PiecePlannerTest, EmptyFileHasNoPieces) {
    PiecePlan plan = PiecePlanner::plan(0, 1024);
    EXPECT_EQ(plan.get_piece_count(), 0);
    EXPECT_EQ(plan.file_size, 0);
}

TEST(PiecePlannerTest, SameInputsGiveSamePlan) {
    PiecePlan first = PiecePlanner::plan(123457, 1000);
    PiecePlan second = PiecePlanner::plan(123457, 1000);
    ASSERT_EQ(first.get_piece_count(), second.get_piece_count());
    for (int i = 0; i < first.get_piece_count(); ++i) {
        EXPECT_EQ(first.pieces[i].offset, second.pieces[i].offset);
        EXPECT_EQ(first.pieces[i].length, second.pieces[i].length);
    }
    EXPECT_TRUE(first.matches(123457, 1000, second.pieces.size()));
    EXPECT_FALSE(first.matches(123457, 2000, second.pieces.size()));
    EXPECT_FALSE(first.matches(123456, 1000, second.pieces.size()));
}

TEST(PiecePlannerTest, RejectsInvalidInputs) {
    EXPECT_THROW(PiecePlanner::plan(100, 0), ConfigurationError);
    EXPECT_THROW(PiecePlanner::plan(100, -5), ConfigurationError);
    EXPECT_THROW(PiecePlanner::plan(-1, 10), ConfigurationError);
}

TEST(PiecePlannerTest, RejectsPieceCountBeyondIndexRange) {
    EXPECT_THROW(PiecePlanner::plan(int64_t(1) << 40, 1), ConfigurationError);
}
