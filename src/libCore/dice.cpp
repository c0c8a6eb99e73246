#include "core/dice.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace minigam {

UniformDieSource::UniformDieSource() : m_rng{std::random_device{}()} {
}

UniformDieSource::UniformDieSource(const uint32_t seed) : m_rng{seed} {
}

DieValue UniformDieSource::throwDie() {
	return m_dist(m_rng);
}

static bool allValid(const std::vector<DieValue>& values) {
	return std::all_of(values.begin(), values.end(), [](DieValue v) { return isValidDie(v); });
}

//! Checks a snapshot could have been produced by roll/consume calls.
static bool isWellFormed(const DiceSnapshot& s) {
	if (!allValid(s.pending) || !allValid(s.rolled) || !allValid(s.completed)) {
		return false;
	}
	if (s.awaitingRoll) {
		return s.pending.empty() && s.rolled.empty() && s.completed.empty();
	}
	if (s.rolled.size() != 2u && s.rolled.size() != 4u) {
		return false;
	}
	if (s.rolled != Dice::expandedRoll(s.rolled[0], s.rolled[1])) {
		return false;
	}

	// Pending and completed together must be a permutation of the roll.
	auto played = s.pending;
	played.insert(played.end(), s.completed.begin(), s.completed.end());
	return std::is_permutation(played.begin(), played.end(), s.rolled.begin(), s.rolled.end());
}

Dice::Dice() : m_source{std::make_unique<UniformDieSource>()} {
}

Dice::Dice(std::unique_ptr<IDieSource> source) : m_source{std::move(source)} {
	if (!m_source) {
		throw InvariantError("Dice require a die source.");
	}
}

std::vector<DieValue> Dice::expandedRoll(const DieValue first, const DieValue second) {
	if (!isValidDie(first) || !isValidDie(second)) {
		throw InvariantError(std::format("Invalid die value in roll {}-{}.", first, second));
	}
	if (first == second) {
		return {first, first, first, first};
	}
	return {first, second};
}

std::vector<DieValue> Dice::roll() {
	const auto first  = m_source->throwDie();
	const auto second = m_source->throwDie();
	const auto values = expandedRoll(first, second);

	m_pending = values;
	m_rolled  = values;
	m_completed.clear();
	m_awaitingRoll = false;
	return values;
}

std::optional<DiceToken> Dice::consume(const DieValue value) {
	if (!isValidDie(value)) {
		return std::nullopt;
	}

	const auto it = std::find(m_pending.begin(), m_pending.end(), value);
	if (it == m_pending.end()) {
		return std::nullopt;
	}

	const auto index = static_cast<std::size_t>(std::distance(m_pending.begin(), it));
	m_pending.erase(it);
	m_completed.push_back(value);
	return DiceToken{.value = value, .index = index};
}

void Dice::returnValue(const DiceToken& token) {
	if (!isValidDie(token.value)) {
		throw InvariantError(std::format("Cannot return invalid die value {}.", token.value));
	}

	// consume() appends, so the matching entry is the last one.
	const auto it = std::find(m_completed.rbegin(), m_completed.rend(), token.value);
	if (it == m_completed.rend()) {
		throw InvariantError(std::format("Die {} was not consumed this turn.", token.value));
	}
	m_completed.erase(std::next(it).base());

	const auto index = std::min(token.index, m_pending.size());
	m_pending.insert(m_pending.begin() + static_cast<std::ptrdiff_t>(index), token.value);
}

void Dice::reset() {
	m_pending.clear();
	m_rolled.clear();
	m_completed.clear();
	m_awaitingRoll = true;
}

DiceSnapshot Dice::snapshot() const {
	return DiceSnapshot{
	        .pending      = m_pending,
	        .rolled       = m_rolled,
	        .completed    = m_completed,
	        .awaitingRoll = m_awaitingRoll,
	};
}

void Dice::restore(const DiceSnapshot& snapshot) {
	if (!isWellFormed(snapshot)) {
		throw InvariantError("Malformed dice snapshot.");
	}

	m_pending      = snapshot.pending;
	m_rolled       = snapshot.rolled;
	m_completed    = snapshot.completed;
	m_awaitingRoll = snapshot.awaitingRoll;
}

const std::vector<DieValue>& Dice::pending() const {
	return m_pending;
}
const std::vector<DieValue>& Dice::rolled() const {
	return m_rolled;
}
const std::vector<DieValue>& Dice::completed() const {
	return m_completed;
}
bool Dice::awaitingRoll() const {
	return m_awaitingRoll;
}
bool Dice::hasPending() const {
	return !m_pending.empty();
}

} // namespace minigam
