#pragma once

#include "core/types.hpp"

namespace minigam {

//! Movement configuration of one player. Both players share every rule; only these numbers differ.
//! \note Positions are expressed on an extended axis where the bar sits at entryOrigin and the exit at exitPoint.
struct PlayerTraits {
	int direction;       //!< +1 when moving towards higher points, -1 otherwise.
	PointId entryOrigin; //!< Virtual point a checker on the bar starts from.
	PointId exitPoint;   //!< First virtual point past the board on the bearing off side.
};

inline constexpr PlayerTraits kHumanTraits{.direction = +1, .entryOrigin = 0, .exitPoint = kPointCount + 1};
inline constexpr PlayerTraits kAiTraits{.direction = -1, .entryOrigin = kPointCount + 1, .exitPoint = 0};

inline constexpr const PlayerTraits& traitsOf(Player player) {
	return player == Player::Human ? kHumanTraits : kAiTraits;
}

//! Point a checker from the bar lands on for the given die.
inline constexpr PointId entryTarget(Player player, DieValue die) {
	const auto& traits = traitsOf(player);
	return traits.entryOrigin + traits.direction * die;
}

//! Die needed to enter on targetPoint.
inline constexpr DieValue entryDieForTarget(Player player, PointId targetPoint) {
	const auto& traits = traitsOf(player);
	return (targetPoint - traits.entryOrigin) * traits.direction;
}

//! Destination of a checker on originPoint moved by die. May be off the board.
inline constexpr PointId computeTarget(Player player, PointId originPoint, DieValue die) {
	return originPoint + traitsOf(player).direction * die;
}

//! Origin a checker must come from to reach candidateTarget with die.
inline constexpr PointId computeOrigin(Player player, PointId candidateTarget, DieValue die) {
	return candidateTarget - traitsOf(player).direction * die;
}

//! Exact die that bears a checker off from pointNumber.
inline constexpr DieValue bearingDie(Player player, PointId pointNumber) {
	const auto& traits = traitsOf(player);
	return (traits.exitPoint - pointNumber) * traits.direction;
}

//! Returns whether a destination reaches or passes the exit.
inline constexpr bool isPastExit(Player player, PointId target) {
	const auto& traits = traitsOf(player);
	return (target - traits.exitPoint) * traits.direction >= 0;
}

} // namespace minigam
