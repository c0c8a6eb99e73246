#include "app/inputMachine.hpp"

#include <format>

namespace minigam::app {

std::optional<InputToken> tokenFromKey(const char key) {
	switch (key) {
	case ' ':
		return InputToken::roll();
	case 'b':
	case 'B':
		return InputToken::beginBear();
	case 'm':
	case 'M':
		return InputToken::beginMove();
	case 'p':
	case 'P':
	case 'x':
	case 'X':
		return InputToken::cancel();
	default:
		break;
	}

	if (key >= '0' && key <= '9') {
		return InputToken::point(key - '0');
	}
	return std::nullopt;
}

// clang-format off
const std::array<std::array<InputMachine::Handler, InputMachine::kTokenCount>, InputMachine::kStateCount> InputMachine::kTransitions{{
	//                  Roll                           Digit                            BeginBear                       BeginMove                       Cancel
	/* AwaitRoll */       {&InputMachine::rollToStart,     &InputMachine::rejectRollFirst,  &InputMachine::rejectRollFirst, &InputMachine::rejectRollFirst, &InputMachine::rejectRollFirst},
	/* AwaitCommand */    {&InputMachine::rollWhileActing, &InputMachine::digitAsEntry,     &InputMachine::beginBear,       &InputMachine::beginMove,       &InputMachine::cancelTurn},
	/* AwaitBearPoint */  {&InputMachine::rollWhileActing, &InputMachine::digitAsBearPoint, &InputMachine::beginBear,       &InputMachine::beginMove,       &InputMachine::cancelTurn},
	/* AwaitMoveOrigin */ {&InputMachine::rollWhileActing, &InputMachine::digitAsOrigin,    &InputMachine::beginBear,       &InputMachine::beginMove,       &InputMachine::cancelTurn},
	/* AwaitMoveTarget */ {&InputMachine::rollWhileActing, &InputMachine::digitAsTarget,    &InputMachine::beginBear,       &InputMachine::beginMove,       &InputMachine::cancelTurn},
}};
// clang-format on

InputMachine::InputMachine(TurnController& controller) : m_controller{controller} {
	syncWithTurn();
}

InputResult InputMachine::handle(const InputToken& token) {
	switch (m_controller.state()) {
	case TurnState::GameOver:
		if (token.kind == TokenKind::Roll) {
			m_controller.restart();
			syncWithTurn();
			return InputResult::Accepted;
		}
		m_controller.reject("Game over. Press roll to restart.");
		return InputResult::GameOver;
	case TurnState::AiActing:
		m_controller.reject("Wait for the AI to finish.");
		return InputResult::NotYourTurn;
	case TurnState::AwaitingRoll:
	case TurnState::HumanActing:
		break;
	}

	syncWithTurn();
	const auto handler = kTransitions[static_cast<std::size_t>(m_state)][static_cast<std::size_t>(token.kind)];
	const auto result  = (this->*handler)(token);
	syncWithTurn();
	return result;
}

InputState InputMachine::state() const {
	return m_state;
}

std::optional<PointId> InputMachine::moveOrigin() const {
	return m_origin;
}

void InputMachine::syncWithTurn() {
	if (m_controller.state() != TurnState::HumanActing) {
		m_state = InputState::AwaitRoll;
		m_origin.reset();
	} else if (m_state == InputState::AwaitRoll) {
		m_state = InputState::AwaitCommand;
	}
}

InputResult InputMachine::done(const bool accepted) {
	return accepted ? InputResult::Accepted : InputResult::Rejected;
}

bool InputMachine::isPoint(const InputToken& token) {
	if (!withinBoard(token.digit)) {
		m_controller.reject(std::format("Point {} out of range.", token.digit));
		return false;
	}
	return true;
}

InputResult InputMachine::rollToStart(const InputToken&) {
	return done(m_controller.roll());
}

InputResult InputMachine::rejectRollFirst(const InputToken&) {
	m_controller.reject("Roll first.");
	return InputResult::RollFirst;
}

InputResult InputMachine::digitAsEntry(const InputToken& token) {
	if (!isPoint(token)) {
		return InputResult::Rejected;
	}
	if (!m_controller.hasBarCheckers()) {
		m_controller.reject("Use m (move) or b (bear) followed by a point.");
		return InputResult::NeedCommand;
	}
	return done(m_controller.enter(token.digit));
}

InputResult InputMachine::beginBear(const InputToken&) {
	m_state = InputState::AwaitBearPoint;
	m_origin.reset();
	return InputResult::Accepted;
}

InputResult InputMachine::beginMove(const InputToken&) {
	m_state = InputState::AwaitMoveOrigin;
	m_origin.reset();
	return InputResult::Accepted;
}

InputResult InputMachine::digitAsBearPoint(const InputToken& token) {
	if (!isPoint(token)) {
		return InputResult::Rejected;
	}
	m_state = InputState::AwaitCommand;
	return done(m_controller.bearOff(token.digit));
}

InputResult InputMachine::digitAsOrigin(const InputToken& token) {
	if (!isPoint(token)) {
		return InputResult::Rejected;
	}
	m_origin = token.digit;
	m_state  = InputState::AwaitMoveTarget;
	return InputResult::Accepted;
}

InputResult InputMachine::digitAsTarget(const InputToken& token) {
	if (!isPoint(token)) {
		return InputResult::Rejected;
	}
	const auto origin = m_origin.value_or(0);
	m_origin.reset();
	m_state = InputState::AwaitCommand;
	return done(m_controller.move(origin, token.digit));
}

InputResult InputMachine::rollWhileActing(const InputToken&) {
	// Rolled already: with dice left the roll key takes the turn back, without it ends the turn.
	const bool accepted = m_controller.hasPendingDice() ? m_controller.undoToRollTime() : m_controller.endTurnVoluntarily();
	if (accepted) {
		m_state = InputState::AwaitCommand;
		m_origin.reset();
	}
	return done(accepted);
}

InputResult InputMachine::cancelTurn(const InputToken&) {
	return done(m_controller.forcePass());
}

} // namespace minigam::app
