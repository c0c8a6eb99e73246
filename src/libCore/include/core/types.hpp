#pragma once

#include <cstdint>

namespace minigam {

using PointId  = int; //!< Board point number. On-board points are 1..kPointCount, anything else is off the board.
using DieValue = int; //!< Single die face.

inline constexpr int kPointCount             = 6;
inline constexpr unsigned kCheckersPerPlayer = 8u;
inline constexpr DieValue kMinDie            = 1;
inline constexpr DieValue kMaxDie            = 6;

enum class Player { Human = 1, Ai = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::Human ? Player::Ai : Player::Human;
}

inline constexpr bool isValidDie(DieValue value) {
	return value >= kMinDie && value <= kMaxDie;
}

inline constexpr bool withinBoard(PointId point) {
	return point >= 1 && point <= kPointCount;
}

//! Display name used in messages and logs.
inline constexpr const char* toString(Player player) {
	return player == Player::Human ? "Human" : "Ai";
}

} // namespace minigam
