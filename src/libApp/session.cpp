#include "app/session.hpp"

namespace minigam::app {

GameSession::GameSession(std::unique_ptr<IDieSource> dieSource) : dice{std::move(dieSource)} {
}

void GameSession::reset() {
	board.reset();
	dice.reset();
	currentPlayer = Player::Human;
	gameOver      = false;
	winner.reset();
	turnSnapshot.reset();
}

} // namespace minigam::app
