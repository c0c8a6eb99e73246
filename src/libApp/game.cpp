#include "app/game.hpp"
#include "Logging.hpp"

#include <format>

namespace minigam::app {

static std::unique_ptr<IDieSource> makeDieSource(const SessionConfig& config) {
	if (config.seed) {
		return std::make_unique<UniformDieSource>(*config.seed);
	}
	return std::make_unique<UniformDieSource>();
}

Game::Game(const SessionConfig& config) : Game(config, makeDieSource(config)) {
}

Game::Game(const SessionConfig& config, std::unique_ptr<IDieSource> dieSource)
    : m_session{std::move(dieSource)}, m_controller{m_session, m_eventHub, config}, m_input{m_controller} {
	Logger().Log(Logging::LogLevel::Info, "[Game] Session started. Human to roll.");
}

InputResult Game::pushToken(const InputToken& token) {
	return m_input.handle(token);
}

InputResult Game::pushKey(const char key) {
	if (const auto token = tokenFromKey(key)) {
		return m_input.handle(*token);
	}

	m_controller.reject(std::format("Unknown key '{}'.", key));
	return InputResult::Rejected;
}

SessionView Game::view() const {
	return SessionView{
	        .board         = m_session.board,
	        .pendingDice   = m_session.dice.pending(),
	        .rolledDice    = m_session.dice.rolled(),
	        .completedDice = m_session.dice.completed(),
	        .awaitingRoll  = m_session.dice.awaitingRoll(),
	        .currentPlayer = m_session.currentPlayer,
	        .gameOver      = m_session.gameOver,
	        .winner        = m_session.winner,
	        .inputState    = m_input.state(),
	};
}

TurnController& Game::controller() {
	return m_controller;
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeMessages(IGameMessageListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeMessages(IGameMessageListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace minigam::app
