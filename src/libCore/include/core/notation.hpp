#pragma once

#include "core/move.hpp"

#include <string>
#include <vector>

namespace minigam {

//! Key sequence that plays move: "3" for an entry, "m 1 4" for a move, "b 6" for a bear off.
std::string formatMove(const Move& move);

//! Unique move notations joined by "; ", or "no legal moves".
std::string summarizeMoves(const std::vector<Move>& moves);

} // namespace minigam
