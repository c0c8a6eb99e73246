#pragma once

#include "core/board.hpp"
#include "core/dice.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>

namespace minigam::app {

//! Board and dice as they were right after the roll. Lives for one turn.
struct TurnSnapshot {
	Board board;
	DiceSnapshot dice;
};

//! Mutable state of one game. Created once, mutated in place across turns and restarts.
struct GameSession {
	Board board;
	Dice dice;
	Player currentPlayer{Player::Human};
	bool gameOver{false};
	std::optional<Player> winner;
	std::optional<TurnSnapshot> turnSnapshot;

public:
	explicit GameSession(std::unique_ptr<IDieSource> dieSource);

	void reset(); //!< All checkers back on the bars, Human to roll.
};

} // namespace minigam::app
