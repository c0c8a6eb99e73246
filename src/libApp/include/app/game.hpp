#pragma once

#include "app/eventHub.hpp"
#include "app/inputMachine.hpp"
#include "app/session.hpp"
#include "app/sessionConfig.hpp"
#include "app/turnController.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace minigam::app {

//! Read only copy of everything presentation (rendering, text export) needs.
struct SessionView {
	Board board;
	std::vector<DieValue> pendingDice;
	std::vector<DieValue> rolledDice;
	std::vector<DieValue> completedDice;
	bool awaitingRoll{true};
	Player currentPlayer{Player::Human};
	bool gameOver{false};
	std::optional<Player> winner;
	InputState inputState{InputState::AwaitRoll};
};

//! Owns one game session and wires dice, turn controller and input handling together.
//! Presentation renders from view() and forwards raw input; it performs no rule validation.
class Game {
public:
	explicit Game(const SessionConfig& config = {});
	Game(const SessionConfig& config, std::unique_ptr<IDieSource> dieSource); //!< Custom dice, e.g. for replays.

	InputResult pushToken(const InputToken& token);
	InputResult pushKey(char key); //!< Unknown keys are rejected.

	SessionView view() const;
	TurnController& controller();

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeMessages(IGameMessageListener* listener);
	void unsubscribeMessages(IGameMessageListener* listener);

private:
	EventHub m_eventHub;
	GameSession m_session;
	TurnController m_controller;
	InputMachine m_input;
};

} // namespace minigam::app
