#include <gtest/gtest.h>
#include "storage/TransferState.hpp"
#include "storage/DestinationFile.hpp"
#include "core/PiecePlanner.hpp"
#include "core/Errors.hpp"
#include "utils/CryptoUtils.hpp"
#include "support/FakeTransport.hpp"
#include "support/TempDir.hpp"
#include <nlohmann/json.hpp>

class TransferStateTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string destination = dir.file("image.bin");
    PiecePlan plan = PiecePlanner::plan(1000, 300);
};

TEST_F(TransferStateTest, FirstLoadCreatesRecord) {
    TransferState state(destination);
    EXPECT_EQ(state.load_or_create(plan), LoadOutcome::Created);
    EXPECT_TRUE(TransferState::has_record(destination));
    EXPECT_EQ(state.get_record_path(), destination + ".zdm.json");
    EXPECT_FALSE(file_exists(state.get_record_path() + ".tmp"));

    TransferRecord record = TransferState::read(destination);
    EXPECT_EQ(record.destination, destination);
    EXPECT_EQ(record.file_size, 1000);
    EXPECT_EQ(record.piece_size, 300);
    ASSERT_EQ(record.get_total_count(), 4);
    EXPECT_EQ(record.pieces[3].offset, 900);
    EXPECT_EQ(record.pieces[3].length, 100);
    EXPECT_EQ(record.get_verified_count(), 0);
    EXPECT_EQ(record.get_unverified_indices(), (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(TransferStateTest, MarksSurviveReload) {
    {
        TransferState state(destination);
        state.load_or_create(plan);
        state.mark(1, PieceStatus::Verified, "digest-one", "http://a/file");
    }

    TransferState resumed(destination);
    EXPECT_EQ(resumed.load_or_create(plan), LoadOutcome::Resumed);
    const Piece& piece = resumed.get_piece(1);
    EXPECT_EQ(piece.status, PieceStatus::Verified);
    EXPECT_EQ(piece.sha256, "digest-one");
    EXPECT_EQ(piece.mirror, "http://a/file");
    EXPECT_EQ(resumed.snapshot().get_verified_count(), 1);
}

TEST_F(TransferStateTest, EmptyDigestKeepsStoredValue) {
    TransferState state(destination);
    state.load_or_create(plan);
    state.mark(0, PieceStatus::Verified, "digest-zero", "http://a/file");
    state.mark(0, PieceStatus::Pending, "", "");

    const Piece& piece = state.get_piece(0);
    EXPECT_EQ(piece.status, PieceStatus::Pending);
    EXPECT_EQ(piece.sha256, "digest-zero");
    EXPECT_EQ(piece.mirror, "http://a/file");
}

TEST_F(TransferStateTest, InterruptedPiecesComeBackPending) {
    {
        TransferState state(destination);
        state.load_or_create(plan);
        state.mark(0, PieceStatus::InFlight, "", "");
        state.mark(2, PieceStatus::Failed, "", "");
        state.mark(3, PieceStatus::Verified, "d3", "http://a/file");
    }
    EXPECT_EQ(TransferState::read(destination).pieces[0].status, PieceStatus::InFlight);

    TransferState resumed(destination);
    ASSERT_EQ(resumed.load_or_create(plan), LoadOutcome::Resumed);
    EXPECT_EQ(resumed.get_piece(0).status, PieceStatus::Pending);
    EXPECT_EQ(resumed.get_piece(2).status, PieceStatus::Pending);
    EXPECT_EQ(resumed.get_piece(3).status, PieceStatus::Verified);

    // The reconciled state is written back before any fetching starts
    TransferRecord on_disk = TransferState::read(destination);
    EXPECT_EQ(on_disk.pieces[0].status, PieceStatus::Pending);
    EXPECT_EQ(on_disk.get_unverified_indices(), (std::vector<int>{0, 1, 2}));
}

TEST_F(TransferStateTest, PlanChangeDiscardsRecordAndPartialFile) {
    {
        TransferState state(destination);
        state.load_or_create(plan);
        state.mark(0, PieceStatus::Verified, "d0", "http://a/file");
    }
    write_file(destination, std::string(1000, 'x'));

    TransferState restarted(destination);
    EXPECT_EQ(restarted.load_or_create(PiecePlanner::plan(1000, 200)), LoadOutcome::Restarted);
    EXPECT_FALSE(file_exists(destination));

    TransferRecord record = TransferState::read(destination);
    EXPECT_EQ(record.piece_size, 200);
    EXPECT_EQ(record.get_total_count(), 5);
    EXPECT_EQ(record.get_verified_count(), 0);
}

TEST_F(TransferStateTest, FileSizeChangeRestarts) {
    {
        TransferState state(destination);
        state.load_or_create(plan);
    }
    TransferState restarted(destination);
    EXPECT_EQ(restarted.load_or_create(PiecePlanner::plan(1200, 300)), LoadOutcome::Restarted);
}

TEST_F(TransferStateTest, CorruptRecordRestarts) {
    write_file(TransferState::record_path_for(destination), "{\"format\": 1, \"pieces\": [");

    TransferState state(destination);
    EXPECT_EQ(state.load_or_create(plan), LoadOutcome::Restarted);
    EXPECT_EQ(TransferState::read(destination).get_total_count(), 4);
}

TEST_F(TransferStateTest, UnknownFormatRestarts) {
    {
        TransferState state(destination);
        state.load_or_create(plan);
    }
    std::string path = TransferState::record_path_for(destination);
    nlohmann::json doc = nlohmann::json::parse(read_file(path));
    doc["format"] = 99;
    write_file(path, doc.dump());

    TransferState state(destination);
    EXPECT_EQ(state.load_or_create(plan), LoadOutcome::Restarted);
}

TEST_F(TransferStateTest, ReverifyDemotesChangedPieces) {
    std::string content = make_content(1000, 7);
    TransferState state(destination);
    state.load_or_create(plan);

    DestinationFile file(destination);
    file.resize(1000);
    file.write_at(0, reinterpret_cast<const uint8_t*>(content.data()), content.size());
    for (const auto& piece : plan.pieces) {
        std::string digest = CryptoUtils::sha256_to_hex(content.substr(piece.offset, piece.length));
        state.mark(piece.index, PieceStatus::Verified, digest, "http://a/file");
    }
    std::string expected_digest = state.get_piece(1).sha256;

    const uint8_t garbage[] = {0xde, 0xad, 0xbe, 0xef};
    file.write_at(350, garbage, sizeof(garbage));

    std::vector<int> demoted = state.reverify(file);
    EXPECT_EQ(demoted, (std::vector<int>{1}));
    EXPECT_EQ(state.get_piece(1).status, PieceStatus::Pending);
    EXPECT_EQ(state.get_piece(1).sha256, expected_digest);
    EXPECT_EQ(state.get_piece(0).status, PieceStatus::Verified);
    EXPECT_EQ(TransferState::read(destination).pieces[1].status, PieceStatus::Pending);
}

TEST_F(TransferStateTest, ReverifyDemotesPiecesPastTruncatedEnd) {
    std::string content = make_content(1000, 8);
    TransferState state(destination);
    state.load_or_create(plan);
    std::string digest = CryptoUtils::sha256_to_hex(content.substr(900, 100));
    state.mark(3, PieceStatus::Verified, digest, "http://a/file");

    write_file(destination, content.substr(0, 950));
    DestinationFile file(destination);
    EXPECT_EQ(state.reverify(file), (std::vector<int>{3}));
}

TEST_F(TransferStateTest, RetireRemovesRecord) {
    TransferState state(destination);
    state.load_or_create(plan);
    state.retire();
    EXPECT_FALSE(TransferState::has_record(destination));
}

TEST_F(TransferStateTest, ReadWithoutRecordThrows) {
    EXPECT_THROW(TransferState::read(destination), StorageError);
}

TEST_F(TransferStateTest, PieceIndexIsBoundsChecked) {
    TransferState state(destination);
    state.load_or_create(plan);
    EXPECT_THROW(state.get_piece(4), std::out_of_range);
    EXPECT_THROW(state.mark(-1, PieceStatus::Verified, "", ""), std::out_of_range);
}

TEST_F(TransferStateTest, InFlightMarksStayInMemory) {
    TransferState state(destination);
    state.load_or_create(plan);
    int saves = state.get_save_count();

    state.mark(0, PieceStatus::InFlight, "", "");
    EXPECT_EQ(state.get_save_count(), saves);
    EXPECT_EQ(TransferState::read(destination).pieces[0].status, PieceStatus::Pending);

    state.mark(0, PieceStatus::Verified, "d0", "http://a/file");
    EXPECT_EQ(state.get_save_count(), saves + 1);
    EXPECT_EQ(TransferState::read(destination).pieces[0].status, PieceStatus::Verified);
}

TEST_F(TransferStateTest, MarksAreBatchedUntilFlush) {
    TransferState state(destination);
    state.load_or_create(PiecePlanner::plan(1000, 100));
    state.set_save_every(4);
    int saves = state.get_save_count();

    for (int i = 0; i < 10; ++i) {
        state.mark(i, PieceStatus::InFlight, "", "");
        state.mark(i, PieceStatus::Verified, "d" + std::to_string(i), "http://a/file");
    }
    EXPECT_EQ(state.get_save_count(), saves + 2);
    EXPECT_EQ(TransferState::read(destination).get_verified_count(), 8);

    state.flush();
    EXPECT_EQ(state.get_save_count(), saves + 3);
    EXPECT_EQ(TransferState::read(destination).get_verified_count(), 10);

    state.flush();
    EXPECT_EQ(state.get_save_count(), saves + 3);
}

TEST_F(TransferStateTest, RecordForAnotherDestinationRestarts) {
    {
        TransferState state(destination);
        state.load_or_create(plan);
        state.mark(0, PieceStatus::Verified, "d0", "http://a/file");
    }
    std::string path = TransferState::record_path_for(destination);
    nlohmann::json doc = nlohmann::json::parse(read_file(path));
    doc["destination"] = dir.file("other.bin");
    write_file(path, doc.dump());

    TransferState state(destination);
    EXPECT_EQ(state.load_or_create(plan), LoadOutcome::Restarted);
    TransferRecord record = TransferState::read(destination);
    EXPECT_EQ(record.destination, destination);
    EXPECT_EQ(record.get_verified_count(), 0);
}
