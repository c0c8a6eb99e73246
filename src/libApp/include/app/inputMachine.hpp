#pragma once

#include "app/turnController.hpp"
#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>

namespace minigam::app {

enum class InputState {
	AwaitRoll,       //!< Only the roll token does something.
	AwaitCommand,    //!< Dice rolled, waiting for an entry point or a command prefix.
	AwaitBearPoint,  //!< Bear prefix given, waiting for the point.
	AwaitMoveOrigin, //!< Move prefix given, waiting for the origin.
	AwaitMoveTarget, //!< Origin given, waiting for the target.
};

enum class TokenKind {
	Roll,      //!< Roll; undo or end turn once rolled; restart after game over.
	Digit,     //!< Point number.
	BeginBear, //!< Start a bear off command.
	BeginMove, //!< Start a move command.
	Cancel,    //!< Force pass.
};

struct InputToken {
	TokenKind kind;
	PointId digit{0}; //!< Only used for TokenKind::Digit.

	static InputToken roll() { return {TokenKind::Roll}; }
	static InputToken point(PointId digit) { return {TokenKind::Digit, digit}; }
	static InputToken beginBear() { return {TokenKind::BeginBear}; }
	static InputToken beginMove() { return {TokenKind::BeginMove}; }
	static InputToken cancel() { return {TokenKind::Cancel}; }
};

//! Key mapping: space rolls, '1'-'6' are points, 'b' bears off, 'm' moves, 'p' or 'x' passes.
std::optional<InputToken> tokenFromKey(char key);

enum class InputResult {
	Accepted,    //!< Token consumed; a command may have been played.
	RollFirst,   //!< Dice have to be rolled before anything else.
	NeedCommand, //!< Digit without a command prefix while no checker is on the bar.
	Rejected,    //!< The turn controller refused the command.
	NotYourTurn, //!< The AI is playing.
	GameOver,    //!< Only a restart is possible.
};

//! Assembles single key tokens into turn controller commands.
//! Holds no rule knowledge and never touches board or dice; everything goes through the TurnController.
class InputMachine {
public:
	explicit InputMachine(TurnController& controller);

	InputResult handle(const InputToken& token);

	InputState state() const;
	std::optional<PointId> moveOrigin() const; //!< Origin stored while in AwaitMoveTarget.

private:
	using Handler = InputResult (InputMachine::*)(const InputToken&);

	static constexpr std::size_t kStateCount = 5u;
	static constexpr std::size_t kTokenCount = 5u;
	static const std::array<std::array<Handler, kTokenCount>, kStateCount> kTransitions; //!< [state][token kind]

	void syncWithTurn(); //!< Follow turn changes done by the controller (pass, hand over, restart).
	InputResult done(bool accepted);
	bool isPoint(const InputToken& token);

	InputResult rollToStart(const InputToken& token);
	InputResult rejectRollFirst(const InputToken& token);
	InputResult digitAsEntry(const InputToken& token);
	InputResult beginBear(const InputToken& token);
	InputResult beginMove(const InputToken& token);
	InputResult digitAsBearPoint(const InputToken& token);
	InputResult digitAsOrigin(const InputToken& token);
	InputResult digitAsTarget(const InputToken& token);
	InputResult rollWhileActing(const InputToken& token);
	InputResult cancelTurn(const InputToken& token);

private:
	TurnController& m_controller;
	InputState m_state{InputState::AwaitRoll};
	std::optional<PointId> m_origin;
};

} // namespace minigam::app
