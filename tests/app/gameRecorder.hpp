#pragma once

#include "app/IGameSignalListener.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace minigam::gtest {

//! Keeps every message and signal the game sends.
class GameRecorder : public app::IGameSignalListener, public app::IGameMessageListener {
public:
	void onGameEvent(const app::GameSignal signal) override {
		signals.push_back(signal);
	}

	void onGameMessage(const app::GameMessage& message) override {
		messages.push_back(message);
	}

	bool saw(const std::string& text) const {
		return std::any_of(messages.begin(), messages.end(), [&](const app::GameMessage& m) { return m.text == text; });
	}

	std::string lastText() const {
		return messages.empty() ? std::string{} : messages.back().text;
	}

	app::MessageKind lastKind() const {
		return messages.back().kind;
	}

	std::size_t rejections() const {
		return static_cast<std::size_t>(std::count_if(messages.begin(), messages.end(), [](const app::GameMessage& m) { return m.kind == app::MessageKind::Rejected; }));
	}

	void clear() {
		signals.clear();
		messages.clear();
	}

public:
	std::vector<app::GameSignal> signals;
	std::vector<app::GameMessage> messages;
};

} // namespace minigam::gtest
