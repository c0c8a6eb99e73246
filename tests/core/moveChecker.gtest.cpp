#include "core/errors.hpp"
#include "core/moveChecker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>

namespace minigam::gtest {

static void place(Board& board, Player player, PointId point, unsigned count) {
	for (unsigned i = 0; i != count; ++i) {
		board.enterFromBar(point, player);
	}
}

//! Leave exactly one checker of player on point with an empty bar.
static Board lastChecker(Player player, PointId point) {
	Board board;
	place(board, player, point, kCheckersPerPlayer);
	for (unsigned i = 1; i != kCheckersPerPlayer; ++i) {
		board.bearOff(point, player);
	}
	return board;
}

//! Spread all checkers of player over points and bear the rest off so the bar is empty.
static Board bearingPosition(Player player, std::initializer_list<PointId> points) {
	Board board;
	const auto spare = *points.begin();
	place(board, player, spare, kCheckersPerPlayer - static_cast<unsigned>(points.size()) + 1);
	for (auto it = points.begin() + 1; it != points.end(); ++it) {
		place(board, player, *it, 1);
	}
	while (board.point(spare).count > 1) {
		board.bearOff(spare, player);
	}
	return board;
}

TEST(PlayerTraits, Formulas) {
	EXPECT_EQ(entryTarget(Player::Human, 3), 3);
	EXPECT_EQ(entryTarget(Player::Ai, 3), 4);
	EXPECT_EQ(entryDieForTarget(Player::Human, 5), 5);
	EXPECT_EQ(entryDieForTarget(Player::Ai, 5), 2);

	EXPECT_EQ(computeTarget(Player::Human, 2, 3), 5);
	EXPECT_EQ(computeTarget(Player::Ai, 2, 3), -1);
	EXPECT_EQ(computeOrigin(Player::Human, 5, 3), 2);
	EXPECT_EQ(computeOrigin(Player::Ai, 2, 3), 5);

	EXPECT_EQ(bearingDie(Player::Human, 6), 1);
	EXPECT_EQ(bearingDie(Player::Human, 1), 6);
	EXPECT_EQ(bearingDie(Player::Ai, 1), 1);
	EXPECT_EQ(bearingDie(Player::Ai, 6), 6);

	EXPECT_TRUE(isPastExit(Player::Human, 7));
	EXPECT_TRUE(isPastExit(Player::Human, 10));
	EXPECT_FALSE(isPastExit(Player::Human, 6));
	EXPECT_TRUE(isPastExit(Player::Ai, 0));
	EXPECT_TRUE(isPastExit(Player::Ai, -3));
	EXPECT_FALSE(isPastExit(Player::Ai, 1));
}

TEST(MoveChecker, FarthestFromExit) {
	Board board;
	EXPECT_FALSE(farthestFromExit(board, Player::Human));

	place(board, Player::Human, 3, 1);
	place(board, Player::Human, 5, 2);
	place(board, Player::Ai, 2, 1);
	place(board, Player::Ai, 4, 1);

	EXPECT_EQ(farthestFromExit(board, Player::Human), 3);
	EXPECT_EQ(farthestFromExit(board, Player::Ai), 4);

	board.moveChecker(3, 6, Player::Human);
	EXPECT_EQ(farthestFromExit(board, Player::Human), 5);
}

TEST(MoveChecker, HasExactBear) {
	const auto board = bearingPosition(Player::Human, {4, 6});

	EXPECT_TRUE(hasExactBear(board, Player::Human, 3));
	EXPECT_TRUE(hasExactBear(board, Player::Human, 1));
	EXPECT_FALSE(hasExactBear(board, Player::Human, 2));
	EXPECT_FALSE(hasExactBear(board, Player::Ai, 3));
}

TEST(MoveChecker, InvalidDieHasNoMoves) {
	Board board;
	place(board, Player::Human, 2, 1);

	EXPECT_TRUE(listLegalMoves(board, Player::Human, 0).empty());
	EXPECT_TRUE(listLegalMoves(board, Player::Human, 7).empty());
}

TEST(MoveChecker, EntryOnFreshBoard) {
	const Board board;

	EXPECT_EQ(listLegalMoves(board, Player::Human, 3), (std::vector<Move>{Move::enter(3, 3)}));
	EXPECT_EQ(listLegalMoves(board, Player::Ai, 3), (std::vector<Move>{Move::enter(4, 3)}));
}

TEST(MoveChecker, EnterAppliesToBoard) {
	Board board;
	applyMove(board, Move::enter(3, 3), Player::Human);

	EXPECT_EQ(board.bar(Player::Human), 7u);
	EXPECT_EQ(board.point(3).owner, Board::Owner::Human);
	EXPECT_EQ(board.point(3).count, 1u);
}

TEST(MoveChecker, EnterHitsBlot) {
	Board board;
	place(board, Player::Ai, 3, 1);

	const auto moves = listLegalMoves(board, Player::Human, 3);
	ASSERT_EQ(moves, (std::vector<Move>{Move::enter(3, 3)}));
	applyMove(board, moves.front(), Player::Human);

	EXPECT_EQ(board.bar(Player::Ai), 8u);
	EXPECT_EQ(board.point(3).owner, Board::Owner::Human);
	EXPECT_EQ(board.point(3).count, 1u);
}

TEST(MoveChecker, BlockedEntry) {
	Board board;
	place(board, Player::Ai, 3, 2);

	EXPECT_TRUE(listLegalMoves(board, Player::Human, 3).empty());

	// AI enters on 7 - die.
	Board mirror;
	place(mirror, Player::Human, 5, 2);
	EXPECT_TRUE(listLegalMoves(mirror, Player::Ai, 2).empty());
}

TEST(MoveChecker, OrderingEntryThenAscendingPoints) {
	Board board;
	place(board, Player::Human, 3, 1);
	place(board, Player::Human, 1, 1);

	const std::vector<Move> expected{
	        Move::enter(1, 1),
	        Move::move(1, 2, 1),
	        Move::move(3, 4, 1),
	};
	EXPECT_EQ(listLegalMoves(board, Player::Human, 1), expected);
}

TEST(MoveChecker, BoardMoveOntoMadePointExcluded) {
	Board board;
	place(board, Player::Human, 1, 1);
	place(board, Player::Ai, 4, 2);
	place(board, Player::Ai, 5, 1);

	const auto three = listLegalMoves(board, Player::Human, 3);
	EXPECT_EQ(std::count(three.begin(), three.end(), Move::move(1, 4, 3)), 0);

	const auto four = listLegalMoves(board, Player::Human, 4);
	EXPECT_EQ(std::count(four.begin(), four.end(), Move::move(1, 5, 4)), 1);
}

TEST(MoveChecker, AiMovesTowardsLowerPoints) {
	Board board;
	place(board, Player::Ai, 5, 1);

	const std::vector<Move> expected{
	        Move::enter(5, 2),
	        Move::move(5, 3, 2),
	};
	EXPECT_EQ(listLegalMoves(board, Player::Ai, 2), expected);
}

TEST(MoveChecker, ExactBearOff) {
	const auto board = bearingPosition(Player::Human, {4, 6});

	const auto moves = listLegalMoves(board, Player::Human, 3);
	EXPECT_EQ(moves, (std::vector<Move>{Move::bear(4, 3)}));
}

TEST(MoveChecker, OvershootSingleChecker) {
	auto board = lastChecker(Player::Human, 5);

	for (DieValue die = 3; die <= kMaxDie; ++die) {
		EXPECT_EQ(listLegalMoves(board, Player::Human, die), (std::vector<Move>{Move::bear(5, die)})) << "die " << die;
	}

	applyMove(board, Move::bear(5, 6), Player::Human);
	EXPECT_EQ(board.borneOff(Player::Human), kCheckersPerPlayer);
}

TEST(MoveChecker, OvershootOnlyFromFarthestChecker) {
	// Bearing dice: point 5 needs 2, point 6 needs 1.
	const auto board = bearingPosition(Player::Human, {5, 6});

	EXPECT_EQ(listLegalMoves(board, Player::Human, 4), (std::vector<Move>{Move::bear(5, 4)}));
}

TEST(MoveChecker, ExactBearSuppressesOvershootElsewhere) {
	// Bearing dice: point 4 needs 3, point 5 needs 2.
	const auto board = bearingPosition(Player::Human, {4, 5});

	const auto moves = listLegalMoves(board, Player::Human, 3);
	EXPECT_EQ(moves, (std::vector<Move>{Move::bear(4, 3)}));
}

TEST(MoveChecker, OvershootNeedsEmptyBar) {
	Board board;
	place(board, Player::Human, 5, 7);
	for (int i = 0; i != 6; ++i) {
		board.bearOff(5, Player::Human);
	}
	ASSERT_EQ(board.bar(Player::Human), 1u);

	EXPECT_EQ(listLegalMoves(board, Player::Human, 6), (std::vector<Move>{Move::enter(6, 6)}));
}

TEST(MoveChecker, ExactBearListedWithCheckerOnBar) {
	Board board;
	place(board, Player::Human, 6, 1);
	place(board, Player::Ai, 1, 2);

	EXPECT_EQ(listLegalMoves(board, Player::Human, 1), (std::vector<Move>{Move::bear(6, 1)}));
}

TEST(MoveChecker, AiOvershoot) {
	const auto single = lastChecker(Player::Ai, 2);
	EXPECT_EQ(listLegalMoves(single, Player::Ai, 5), (std::vector<Move>{Move::bear(2, 5)}));

	// Point 3 is farther from the AI exit than point 2.
	const auto pair = bearingPosition(Player::Ai, {2, 3});
	EXPECT_EQ(listLegalMoves(pair, Player::Ai, 3), (std::vector<Move>{Move::bear(3, 3)}));
	EXPECT_EQ(listLegalMoves(pair, Player::Ai, 5), (std::vector<Move>{Move::bear(3, 5)}));
}

TEST(MoveChecker, ApplyMoveRejectedByBoard) {
	Board board;
	place(board, Player::Ai, 4, 2);
	const Board before = board;

	EXPECT_THROW(applyMove(board, Move::enter(4, 4), Player::Human), ValidationError);
	EXPECT_THROW(applyMove(board, Move::move(2, 4, 2), Player::Human), ValidationError);
	EXPECT_THROW(applyMove(board, Move::bear(6, 1), Player::Human), ValidationError);
	EXPECT_EQ(board, before);
}

TEST(MoveChecker, ApplyMalformedMoveIsFatal) {
	Board board;
	place(board, Player::Human, 2, 1);

	EXPECT_THROW(applyMove(board, Move{.kind = MoveKind::Enter, .source = 2, .target = std::nullopt, .die = 2}, Player::Human), InvariantError);
	EXPECT_THROW(applyMove(board, Move{.kind = MoveKind::Move, .source = 2, .target = std::nullopt, .die = 2}, Player::Human), InvariantError);
	EXPECT_THROW(applyMove(board, Move{.kind = MoveKind::Bear, .source = std::nullopt, .target = 2, .die = 2}, Player::Human), InvariantError);
	EXPECT_THROW(applyMove(board, Move{.kind = static_cast<MoveKind>(7), .source = 2, .target = 4, .die = 2}, Player::Human), InvariantError);
}

TEST(MoveChecker, CloneIsIndependent) {
	Board board;
	place(board, Player::Human, 2, 1);

	auto copy = cloneState(board);
	EXPECT_EQ(copy, board);

	applyMove(copy, Move::move(2, 5, 3), Player::Human);
	EXPECT_NE(copy, board);
	EXPECT_EQ(board.point(2).count, 1u);
}

} // namespace minigam::gtest
