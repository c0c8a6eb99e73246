#pragma once

#include "app/eventHub.hpp"
#include "app/session.hpp"
#include "app/sessionConfig.hpp"
#include "core/move.hpp"

#include <random>
#include <string>
#include <vector>

namespace minigam::app {

enum class TurnState {
	AwaitingRoll, //!< Human has to roll.
	HumanActing,  //!< Human rolled and plays dice.
	AiActing,     //!< Control is with the AI.
	GameOver,     //!< A player bore off every checker.
};

//! Drives a game turn by turn: roll, checker actions, forced passes, hand over and win detection.
//! Human actions are validated through the rule engine; a rejected action reports exactly one message and changes nothing.
//! The AI plays through the same rule engine calls.
class TurnController {
public:
	TurnController(GameSession& session, EventHub& hub, const SessionConfig& config);

	TurnState state() const;

	// Human actions. Return false and report a message if rejected.
	bool roll();
	bool enter(PointId target);
	bool move(PointId origin, PointId target);
	bool bearOff(PointId point);
	bool undoToRollTime();     //!< Restore board and dice to the state right after the roll.
	bool endTurnVoluntarily(); //!< End a turn whose dice are all spent.
	bool forcePass();          //!< End the turn regardless of remaining moves.

	bool runAiTurn(); //!< Play the whole AI turn. Only valid while state() == AiActing.
	void restart();   //!< Reset the session and give the first roll to the human.

	void reject(const std::string& text); //!< Report a refused command.

public:
	//! Moves the current player may play with die. Only entries while checkers are on the bar.
	std::vector<Move> playableMoves(DieValue die) const;
	std::vector<Move> playableMoves() const; //!< Over all pending dice.
	std::string legalMoveSummary() const;    //!< Notation of all playable moves.

	bool hasBarCheckers() const;
	bool hasPendingDice() const;
	bool canUndo() const;

private:
	bool requireHumanActing();
	void rollFor(Player player);
	void playAiTurn(); //!< Roll and play every die at random among the playable moves.
	bool playHumanMove(const Move& move);
	void spendDie(DieValue die);
	void afterHumanAction();
	void endTurn();
	void info(const std::string& text);
	void signalMask(uint64_t mask);

private:
	GameSession& m_session;
	EventHub& m_eventHub;
	bool m_autoAiTurn;
	std::mt19937 m_rng; //!< AI move choice.
};

} // namespace minigam::app
