#include "adpush/upload/session.hpp"

#include <gtest/gtest.h>

using namespace adpush;
using namespace adpush::upload;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

StartResponse started(const std::string& id, std::uint64_t offset = 0) {
    StartResponse response;
    response.session_id = id;
    response.start_offset = offset;
    return response;
}

ChunkResult ack(std::uint64_t next) {
    ChunkResult result;
    result.next_offset = next;
    return result;
}

} // namespace

class UploadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(session_.on_started(started("session-1")).is_ok());
    }

    ChunkRequest next() const {
        auto chunk = session_.next_chunk(2 * kMiB);
        EXPECT_TRUE(chunk.has_value());
        return chunk.value_or(ChunkRequest{});
    }

    UploadSession session_{10 * kMiB};
};

TEST_F(UploadSessionTest, StartSetsSessionAndOffset) {
    EXPECT_EQ(session_.state(), SessionState::Started);
    EXPECT_EQ(session_.session_id(), "session-1");
    EXPECT_EQ(session_.committed_offset(), 0u);
    EXPECT_TRUE(session_.on_started(started("again")).is_error());
}

TEST_F(UploadSessionTest, ChunksFollowCommittedOffset) {
    auto first = next();
    EXPECT_EQ(first.session_id, "session-1");
    EXPECT_EQ(first.start_offset, 0u);
    EXPECT_EQ(first.end_offset, 2 * kMiB);

    auto outcome = session_.on_chunk_acknowledged(first, ack(2 * kMiB));
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), AckOutcome::Advanced);
    EXPECT_EQ(session_.state(), SessionState::Transferring);
    EXPECT_EQ(next().start_offset, 2 * kMiB);
}

TEST_F(UploadSessionTest, PartialAcceptanceResendsTheRemainder) {
    auto first = next();
    ASSERT_EQ(session_.on_chunk_acknowledged(first, ack(kMiB + 17)).value(), AckOutcome::Advanced);

    auto second = next();
    EXPECT_EQ(second.start_offset, kMiB + 17);
    EXPECT_EQ(second.end_offset, 3 * kMiB + 17);
}

TEST_F(UploadSessionTest, LastChunkIsShort) {
    UploadSession session(5 * kMiB);
    ASSERT_TRUE(session.on_started(started("s", 4 * kMiB)).is_ok());
    auto last = session.next_chunk(2 * kMiB);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->size(), kMiB);

    auto outcome = session.on_chunk_acknowledged(*last, ack(5 * kMiB));
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), AckOutcome::ReadyToFinish);
    EXPECT_FALSE(session.next_chunk(2 * kMiB).has_value());
}

TEST_F(UploadSessionTest, AssetIdCompletesTheSession) {
    auto first = next();
    ChunkResult result;
    result.asset_id = "video-9";

    auto outcome = session_.on_chunk_acknowledged(first, result);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), AckOutcome::Completed);
    EXPECT_EQ(session_.state(), SessionState::Completed);
    EXPECT_EQ(session_.info().asset_id, "video-9");
    EXPECT_EQ(session_.committed_offset(), 10 * kMiB);
    EXPECT_TRUE(session_.is_terminal());
}

TEST_F(UploadSessionTest, NoProgressAndRewind) {
    auto first = next();
    EXPECT_EQ(session_.on_chunk_acknowledged(first, ack(0)).value(), AckOutcome::NoProgress);
    EXPECT_EQ(session_.committed_offset(), 0u);

    ASSERT_EQ(session_.on_chunk_acknowledged(first, ack(2 * kMiB)).value(), AckOutcome::Advanced);
    auto second = next();
    auto outcome = session_.on_chunk_acknowledged(second, ack(kMiB));
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), AckOutcome::Rewound);
    EXPECT_EQ(session_.committed_offset(), kMiB);
    EXPECT_EQ(session_.info().rewinds, 1u);
}

TEST_F(UploadSessionTest, RejectsOffsetsBeyondTheChunk) {
    auto first = next();
    auto outcome = session_.on_chunk_acknowledged(first, ack(3 * kMiB));
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::PermanentRejection);

    auto empty = session_.on_chunk_acknowledged(first, ChunkResult{});
    EXPECT_TRUE(empty.is_error());
}

TEST_F(UploadSessionTest, FinishRequiresAllBytes) {
    EXPECT_TRUE(session_.begin_finishing().is_error());

    UploadSession session(3);
    ASSERT_TRUE(session.on_started(started("s")).is_ok());
    auto chunk = session.next_chunk(2 * kMiB);
    ASSERT_TRUE(chunk.has_value());
    ASSERT_EQ(session.on_chunk_acknowledged(*chunk, ack(3)).value(), AckOutcome::ReadyToFinish);

    ASSERT_TRUE(session.begin_finishing().is_ok());
    EXPECT_EQ(session.state(), SessionState::Finishing);

    FinishResponse finish;
    finish.asset_id = "video-3";
    ASSERT_TRUE(session.on_finished(finish).is_ok());
    EXPECT_EQ(session.state(), SessionState::Completed);
    EXPECT_EQ(session.info().asset_id, "video-3");
}

TEST(UploadSessionFinishTest, FallsBackToAnnouncedAssetId) {
    UploadSession session(0);
    auto response = started("s");
    response.asset_hint = "video-7";
    ASSERT_TRUE(session.on_started(response).is_ok());
    EXPECT_FALSE(session.next_chunk(1024).has_value());

    ASSERT_TRUE(session.begin_finishing().is_ok());
    ASSERT_TRUE(session.on_finished(FinishResponse{}).is_ok());
    EXPECT_EQ(session.info().asset_id, "video-7");
}

TEST(UploadSessionFinishTest, FinishWithoutAnyAssetIdFails) {
    UploadSession session(0);
    ASSERT_TRUE(session.on_started(started("s")).is_ok());
    ASSERT_TRUE(session.begin_finishing().is_ok());
    EXPECT_TRUE(session.on_finished(FinishResponse{}).is_error());
}

TEST_F(UploadSessionTest, TerminalStatesAreFinal) {
    session_.mark_failed(make_error(ErrorKind::Transient, "exhausted"));
    EXPECT_EQ(session_.state(), SessionState::Failed);
    ASSERT_TRUE(session_.info().last_error.has_value());
    EXPECT_EQ(session_.info().last_error->message, "exhausted");

    session_.mark_cancelled();
    EXPECT_EQ(session_.state(), SessionState::Failed);
    EXPECT_TRUE(session_.transition_to(SessionState::Transferring).is_error());
}

TEST(UploadSessionTransitionTest, RejectsSkippingStart) {
    UploadSession session(10);
    EXPECT_TRUE(session.transition_to(SessionState::Transferring).is_error());
    EXPECT_TRUE(session.transition_to(SessionState::Cancelled).is_ok());
    EXPECT_TRUE(session.is_terminal());
}

TEST(UploadSessionTransitionTest, StartOffsetBeyondSizeIsRejected) {
    UploadSession session(10);
    EXPECT_TRUE(session.on_started(started("s", 11)).is_error());
    EXPECT_TRUE(session.on_started(started("")).is_error());
    EXPECT_EQ(session.state(), SessionState::NotStarted);
}
