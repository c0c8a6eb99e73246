#pragma once

#include "core/board.hpp"
#include "core/move.hpp"
#include "core/player.hpp"

#include <optional>
#include <vector>

namespace minigam {

//! Occupied point of player farthest from its exit, i.e. the checker most behind. Empty if player has no checker on the board.
//! \note Occupancy changes with every move; compute per query.
std::optional<PointId> farthestFromExit(const Board& board, Player player);

//! Returns whether some checker of player bears off exactly with die.
bool hasExactBear(const Board& board, Player player, DieValue die);

//! Legal single-checker moves of player for one die. Entry first, then board moves and bear offs by ascending point.
//! \note Does not enforce entering before other moves; exact bear offs are listed even with checkers on the bar.
std::vector<Move> listLegalMoves(const Board& board, Player player, DieValue die);

//! Apply move for player. \throws ValidationError if the board rejects it, InvariantError for a malformed move.
void applyMove(Board& board, const Move& move, Player player);

//! Deep value copy for snapshots.
Board cloneState(const Board& board);

} // namespace minigam
