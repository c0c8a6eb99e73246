#pragma once

#include <cstdint>
#include <string>

namespace minigam::app {

//! Types of signals.
enum GameSignal : uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Checkers moved, entered, were hit or borne off.
	GS_DiceChange   = 1 << 1, //!< Dice rolled, spent, returned or reset.
	GS_PlayerChange = 1 << 2, //!< Active player changed.
	GS_StateChange  = 1 << 3, //!< Game started, restarted or finished.
};

enum class MessageKind {
	Info,     //!< Progress of the game (rolls, moves, passes, wins).
	Rejected, //!< A command was refused. State is unchanged.
};

//! User facing text produced by the game.
struct GameMessage {
	MessageKind kind;
	std::string text;
};

} // namespace minigam::app
