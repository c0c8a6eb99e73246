#pragma once

#include "core/types.hpp"

#include <optional>

namespace minigam {

enum class MoveKind {
	Enter, //!< Bar to target.
	Move,  //!< Source to target on the board.
	Bear,  //!< Source off the board.
};

//! A single checker action and the die it consumes.
struct Move {
	MoveKind kind;
	std::optional<PointId> source; //!< Unset for Enter.
	std::optional<PointId> target; //!< Unset for Bear.
	DieValue die;

	bool operator==(const Move&) const = default;

	static Move enter(PointId target, DieValue die) {
		return Move{.kind = MoveKind::Enter, .source = std::nullopt, .target = target, .die = die};
	}
	static Move move(PointId source, PointId target, DieValue die) {
		return Move{.kind = MoveKind::Move, .source = source, .target = target, .die = die};
	}
	static Move bear(PointId source, DieValue die) {
		return Move{.kind = MoveKind::Bear, .source = source, .target = std::nullopt, .die = die};
	}
};

} // namespace minigam
