#pragma once

#include <cstdint>
#include <optional>

namespace minigam::app {

struct SessionConfig {
	std::optional<uint32_t> seed; //!< Seeds dice and AI choices. Nondeterministic when unset.
	bool autoAiTurn{true};        //!< Play the AI turn right after control is handed over.
};

} // namespace minigam::app
