#include "core/errors.hpp"
#include "fakes.hpp"
#include "session/previewCoordinator.hpp"

#include <gtest/gtest.h>

namespace lookahead::gtest {

using session::PendingPreview;
using session::PreviewCoordinator;

static std::vector<MoveOption> movesOneAndTen() {
	return {
	        MoveOption{.id = "1", .resultingState = "after-1", .resultingPlayer = 'O'},
	        MoveOption{.id = "10", .resultingState = "after-10", .resultingPlayer = 'O'},
	};
}

TEST(PreviewCoordinator, RequestsOnlyExactMatches) {
	FakeRenderOracle oracle;
	PreviewCoordinator coordinator(oracle, [](RenderReply) {});
	const auto moves = movesOneAndTen();

	EXPECT_FALSE(coordinator.maybeRequestPreview("", moves));
	EXPECT_FALSE(coordinator.maybeRequestPreview("100", moves));
	EXPECT_FALSE(coordinator.maybeRequestPreview("0", moves));

	const auto one = coordinator.maybeRequestPreview("1", moves);
	ASSERT_TRUE(one);
	EXPECT_EQ(one->board, "after-1");
	EXPECT_EQ(one->ticket.requestedFor, "1");

	const auto ten = coordinator.maybeRequestPreview("10", moves);
	ASSERT_TRUE(ten);
	EXPECT_EQ(ten->board, "after-10");
	EXPECT_GT(ten->ticket.serial, one->ticket.serial);
}

TEST(PreviewCoordinator, IssuedRequestRepliesThroughDeliver) {
	FakeRenderOracle oracle;
	std::vector<RenderReply> delivered;
	PreviewCoordinator coordinator(oracle, [&](RenderReply reply) { delivered.push_back(std::move(reply)); });

	const auto request = coordinator.maybeRequestPreview("10", movesOneAndTen());
	ASSERT_TRUE(request);
	coordinator.issue(*request);

	ASSERT_EQ(oracle.requests().size(), 1u);
	EXPECT_EQ(oracle.requests()[0].board, "after-10");
	EXPECT_EQ(oracle.requests()[0].ticket.serial, request->ticket.serial);

	oracle.complete(0u, "board\n");
	ASSERT_EQ(delivered.size(), 1u);
	EXPECT_EQ(delivered[0].ticket.requestedFor, "10");
	EXPECT_EQ(delivered[0].text, "board\n");
}

TEST(PreviewCoordinator, AcceptsLiveReply) {
	FakeRenderOracle oracle;
	PreviewCoordinator coordinator(oracle, [](RenderReply) {});

	const PendingPreview pending{.ticket = RenderTicket{.serial = 3u, .requestedFor = "1"}};
	const auto preview = coordinator.onReply(pending, RenderReply{.ticket = pending.ticket, .text = "a\nb\n"}, "1");

	ASSERT_TRUE(preview);
	EXPECT_EQ(preview->text, "a\nb\n");
	EXPECT_EQ(preview->lineCount, 2u);
	EXPECT_EQ(preview->renderedFor, "1");
}

TEST(PreviewCoordinator, DropsReplyForChangedPrefix) {
	FakeRenderOracle oracle;
	PreviewCoordinator coordinator(oracle, [](RenderReply) {});

	const PendingPreview pending{.ticket = RenderTicket{.serial = 3u, .requestedFor = "1"}};
	EXPECT_FALSE(coordinator.onReply(pending, RenderReply{.ticket = pending.ticket, .text = "a\n"}, "10"));
}

TEST(PreviewCoordinator, DropsReplyOfEarlierRequestForSamePrefix) {
	FakeRenderOracle oracle;
	PreviewCoordinator coordinator(oracle, [](RenderReply) {});

	const PendingPreview pending{.ticket = RenderTicket{.serial = 5u, .requestedFor = "1"}};
	const RenderReply earlier{.ticket = RenderTicket{.serial = 4u, .requestedFor = "1"}, .text = "old\n"};
	EXPECT_FALSE(coordinator.onReply(pending, earlier, "1"));
}

TEST(PreviewCoordinator, FailedLiveReplyThrows) {
	FakeRenderOracle oracle;
	PreviewCoordinator coordinator(oracle, [](RenderReply) {});

	const PendingPreview pending{.ticket = RenderTicket{.serial = 1u, .requestedFor = "2"}};
	const RenderReply failed{.ticket = pending.ticket, .text = std::nullopt, .error = "connection refused"};
	EXPECT_THROW(coordinator.onReply(pending, failed, "2"), OracleError);
}

TEST(PreviewCoordinator, FailedStaleReplyIsDropped) {
	FakeRenderOracle oracle;
	PreviewCoordinator coordinator(oracle, [](RenderReply) {});

	const PendingPreview pending{.ticket = RenderTicket{.serial = 2u, .requestedFor = "2"}};
	const RenderReply failed{.ticket = RenderTicket{.serial = 1u, .requestedFor = "1"}, .text = std::nullopt, .error = "timeout"};
	EXPECT_NO_THROW(EXPECT_FALSE(coordinator.onReply(pending, failed, "2")));
}

} // namespace lookahead::gtest
