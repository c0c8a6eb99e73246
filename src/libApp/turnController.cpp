#include "app/turnController.hpp"
#include "Logging.hpp"

#include "core/errors.hpp"
#include "core/moveChecker.hpp"
#include "core/notation.hpp"
#include "core/player.hpp"

#include <algorithm>
#include <format>

namespace minigam::app {

namespace {

std::mt19937 makeRng(const SessionConfig& config) {
	return config.seed ? std::mt19937{*config.seed} : std::mt19937{std::random_device{}()};
}

bool containsDie(const std::vector<DieValue>& dice, const DieValue value) {
	return std::find(dice.begin(), dice.end(), value) != dice.end();
}

std::string describeMove(const Player player, const Move& move) {
	switch (move.kind) {
	case MoveKind::Enter:
		return std::format("{} enters on point {}.", toString(player), move.target.value_or(0));
	case MoveKind::Move:
		return std::format("{} moves from {} to {}.", toString(player), move.source.value_or(0), move.target.value_or(0));
	case MoveKind::Bear:
		return std::format("{} bears off from point {}.", toString(player), move.source.value_or(0));
	}
	return formatMove(move);
}

} // namespace

TurnController::TurnController(GameSession& session, EventHub& hub, const SessionConfig& config)
    : m_session{session}, m_eventHub{hub}, m_autoAiTurn{config.autoAiTurn}, m_rng{makeRng(config)} {
}

TurnState TurnController::state() const {
	if (m_session.gameOver) {
		return TurnState::GameOver;
	}
	if (m_session.currentPlayer == Player::Ai) {
		return TurnState::AiActing;
	}
	return m_session.dice.awaitingRoll() ? TurnState::AwaitingRoll : TurnState::HumanActing;
}

bool TurnController::roll() {
	switch (state()) {
	case TurnState::GameOver:
		reject("Game over. Press roll to restart.");
		return false;
	case TurnState::AiActing:
		reject("Wait for the AI to finish.");
		return false;
	case TurnState::HumanActing:
		reject("Dice already rolled.");
		return false;
	case TurnState::AwaitingRoll:
		break;
	}

	rollFor(Player::Human);
	if (playableMoves().empty()) {
		info("No legal moves, passing turn.");
		endTurn();
	}
	return true;
}

bool TurnController::enter(const PointId target) {
	if (!requireHumanActing()) {
		return false;
	}
	if (!hasBarCheckers()) {
		reject("No checker on the bar.");
		return false;
	}
	if (!withinBoard(target)) {
		reject(std::format("Point {} out of range.", target));
		return false;
	}

	const auto die = entryDieForTarget(m_session.currentPlayer, target);
	if (!containsDie(m_session.dice.pending(), die)) {
		reject(std::format("Need a {} to enter on point {}.", die, target));
		return false;
	}
	return playHumanMove(Move::enter(target, die));
}

bool TurnController::move(const PointId origin, const PointId target) {
	if (!requireHumanActing()) {
		return false;
	}
	if (!withinBoard(origin) || !withinBoard(target)) {
		reject(std::format("Point {} out of range.", withinBoard(origin) ? target : origin));
		return false;
	}
	if (hasBarCheckers()) {
		reject("Enter from the bar before moving.");
		return false;
	}

	const auto die = (target - origin) * traitsOf(m_session.currentPlayer).direction;
	if (die <= 0) {
		reject(std::format("Cannot move from {} to {}.", origin, target));
		return false;
	}
	if (!containsDie(m_session.dice.pending(), die)) {
		reject(std::format("Need a {} to move from {} to {}.", die, origin, target));
		return false;
	}
	return playHumanMove(Move::move(origin, target, die));
}

bool TurnController::bearOff(const PointId point) {
	if (!requireHumanActing()) {
		return false;
	}
	if (hasBarCheckers()) {
		reject("Enter from the bar before bearing off.");
		return false;
	}
	if (!withinBoard(point)) {
		reject(std::format("Point {} out of range.", point));
		return false;
	}

	const auto exactDie = bearingDie(m_session.currentPlayer, point);
	std::optional<DieValue> die;
	if (containsDie(m_session.dice.pending(), exactDie)) {
		die = exactDie;
	} else {
		// Smallest larger die the rule engine accepts for this point.
		auto larger = m_session.dice.pending();
		larger.erase(std::remove_if(larger.begin(), larger.end(), [&](DieValue d) { return d <= exactDie; }), larger.end());
		std::sort(larger.begin(), larger.end());

		for (const auto candidate: larger) {
			const auto moves = playableMoves(candidate);
			if (std::find(moves.begin(), moves.end(), Move::bear(point, candidate)) != moves.end()) {
				die = candidate;
				break;
			}
		}
	}

	if (!die) {
		reject(std::format("Need a {} to bear off from point {}.", exactDie, point));
		return false;
	}
	return playHumanMove(Move::bear(point, *die));
}

bool TurnController::undoToRollTime() {
	if (!requireHumanActing()) {
		return false;
	}
	if (!m_session.turnSnapshot) {
		reject("Nothing to undo.");
		return false;
	}
	if (!hasPendingDice()) {
		reject("No dice left to undo.");
		return false;
	}

	m_session.board = m_session.turnSnapshot->board;
	m_session.dice.restore(m_session.turnSnapshot->dice);

	info("Turn reset to roll time.");
	signalMask(GS_BoardChange | GS_DiceChange);
	return true;
}

bool TurnController::endTurnVoluntarily() {
	if (!requireHumanActing()) {
		return false;
	}
	if (hasPendingDice()) {
		reject("Finish your dice before ending the turn.");
		return false;
	}

	info(std::format("Turn passed to {}.", toString(opponent(m_session.currentPlayer))));
	endTurn();
	return true;
}

bool TurnController::forcePass() {
	if (!requireHumanActing()) {
		return false;
	}

	info(std::format("{} passes.", toString(m_session.currentPlayer)));
	endTurn();
	return true;
}

bool TurnController::runAiTurn() {
	if (state() != TurnState::AiActing) {
		reject("It is not the AI's turn.");
		return false;
	}

	playAiTurn();
	return true;
}

void TurnController::playAiTurn() {
	rollFor(Player::Ai);

	const auto diceToPlay = m_session.dice.pending();
	for (const auto die: diceToPlay) {
		if (m_session.board.borneOff(Player::Ai) == kCheckersPerPlayer) {
			break;
		}

		const auto available = playableMoves(die);
		if (available.empty()) {
			info(std::format("{} passes on die {}.", toString(Player::Ai), die));
			spendDie(die);
			signalMask(GS_DiceChange);
			continue;
		}

		std::uniform_int_distribution<std::size_t> pick(0u, available.size() - 1u);
		const auto& choice = available[pick(m_rng)];
		try {
			applyMove(m_session.board, choice, Player::Ai);
		} catch (const ValidationError& e) {
			Logger().Log(Logging::LogLevel::Error, std::format("[TurnController] Listed move '{}' rejected: {}", formatMove(choice), e.what()));
			throw InvariantError(std::format("Rule engine listed an illegal move: {}", e.what()));
		}
		spendDie(die);

		info(describeMove(Player::Ai, choice));
		signalMask(GS_BoardChange | GS_DiceChange);
	}

	endTurn();
}

void TurnController::restart() {
	m_session.reset();

	info("New game. Human to roll.");
	signalMask(GS_BoardChange | GS_DiceChange | GS_PlayerChange | GS_StateChange);
}

void TurnController::reject(const std::string& text) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[TurnController] Rejected: {}", text));
	m_eventHub.message(GameMessage{.kind = MessageKind::Rejected, .text = text});
}

std::vector<Move> TurnController::playableMoves(const DieValue die) const {
	const auto player = m_session.currentPlayer;

	auto moves = listLegalMoves(m_session.board, player, die);
	if (m_session.board.bar(player) > 0) {
		// Checkers on the bar have to enter before anything else moves.
		moves.erase(std::remove_if(moves.begin(), moves.end(), [](const Move& m) { return m.kind != MoveKind::Enter; }), moves.end());
	}
	return moves;
}

std::vector<Move> TurnController::playableMoves() const {
	auto dice = m_session.dice.pending();
	std::sort(dice.begin(), dice.end());
	dice.erase(std::unique(dice.begin(), dice.end()), dice.end());

	std::vector<Move> moves;
	for (const auto die: dice) {
		const auto forDie = playableMoves(die);
		moves.insert(moves.end(), forDie.begin(), forDie.end());
	}
	return moves;
}

std::string TurnController::legalMoveSummary() const {
	return summarizeMoves(playableMoves());
}

bool TurnController::hasBarCheckers() const {
	return m_session.board.bar(m_session.currentPlayer) > 0;
}

bool TurnController::hasPendingDice() const {
	return m_session.dice.hasPending();
}

bool TurnController::canUndo() const {
	return m_session.turnSnapshot.has_value();
}

bool TurnController::requireHumanActing() {
	switch (state()) {
	case TurnState::GameOver:
		reject("Game over. Press roll to restart.");
		return false;
	case TurnState::AiActing:
		reject("Wait for the AI to finish.");
		return false;
	case TurnState::AwaitingRoll:
		reject("Roll first.");
		return false;
	case TurnState::HumanActing:
		return true;
	}
	return false;
}

void TurnController::rollFor(const Player player) {
	std::vector<DieValue> values;
	try {
		values = m_session.dice.roll();
	} catch (const InvariantError& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TurnController] Roll failed: {}", e.what()));
		throw;
	}

	m_session.turnSnapshot = TurnSnapshot{.board = cloneState(m_session.board), .dice = m_session.dice.snapshot()};

	info(std::format("{} rolled {} and {}.", toString(player), values[0], values[1]));
	signalMask(GS_DiceChange);
}

//! Consume the die, apply the move and return the die again if the board refuses.
bool TurnController::playHumanMove(const Move& move) {
	const auto player = m_session.currentPlayer;

	const auto token = m_session.dice.consume(move.die);
	if (!token) {
		reject(std::format("Die {} unavailable.", move.die));
		return false;
	}

	try {
		applyMove(m_session.board, move, player);
	} catch (const ValidationError& e) {
		m_session.dice.returnValue(*token);
		reject(e.what());
		return false;
	}

	info(describeMove(player, move));
	signalMask(GS_BoardChange | GS_DiceChange);
	afterHumanAction();
	return true;
}

void TurnController::spendDie(const DieValue die) {
	if (!m_session.dice.consume(die)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TurnController] Die {} missing from pending dice.", die));
		throw InvariantError(std::format("Die {} missing from pending dice.", die));
	}
}

void TurnController::afterHumanAction() {
	if (!hasPendingDice() || m_session.board.borneOff(m_session.currentPlayer) == kCheckersPerPlayer) {
		endTurn();
		return;
	}

	if (playableMoves().empty()) {
		info("No legal moves remain. Passing turn.");
		endTurn();
	}
}

void TurnController::endTurn() {
	const auto player = m_session.currentPlayer;

	if (m_session.board.borneOff(player) == kCheckersPerPlayer) {
		m_session.gameOver = true;
		m_session.winner   = player;
		m_session.turnSnapshot.reset();

		info(std::format("{} wins!", toString(player)));
		signalMask(GS_StateChange);
		return;
	}

	m_session.dice.reset();
	m_session.turnSnapshot.reset();
	m_session.currentPlayer = opponent(player);

	Logger().Log(Logging::LogLevel::Info, std::format("[TurnController] {} to play.", toString(m_session.currentPlayer)));
	signalMask(GS_DiceChange | GS_PlayerChange);

	if (m_session.currentPlayer == Player::Ai && m_autoAiTurn) {
		playAiTurn();
	}
}

void TurnController::info(const std::string& text) {
	Logger().Log(Logging::LogLevel::Info, std::format("[TurnController] {}", text));
	m_eventHub.message(GameMessage{.kind = MessageKind::Info, .text = text});
}

void TurnController::signalMask(uint64_t mask) {
	for (uint64_t bit = 1; mask != 0; bit <<= 1) {
		if (mask & bit) {
			m_eventHub.signal(static_cast<GameSignal>(bit));
			mask &= ~bit;
		}
	}
}

} // namespace minigam::app
