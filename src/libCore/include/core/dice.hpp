#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace minigam {

//! Source of single die throws.
class IDieSource {
public:
	virtual ~IDieSource()       = default;
	virtual DieValue throwDie() = 0; //!< Expected to return a value in [kMinDie, kMaxDie].
};

//! Uniform die throws from a seeded Mersenne Twister.
class UniformDieSource : public IDieSource {
public:
	UniformDieSource();                       //!< Seeded from std::random_device.
	explicit UniformDieSource(uint32_t seed); //!< Reproducible sequence.

	DieValue throwDie() override;

private:
	std::mt19937 m_rng;
	std::uniform_int_distribution<DieValue> m_dist{kMinDie, kMaxDie};
};

//! Allows to undo a single consume() call.
struct DiceToken {
	DieValue value;
	std::size_t index; //!< Position the value had in the pending list.
};

//! Value copy of the dice state.
struct DiceSnapshot {
	std::vector<DieValue> pending;
	std::vector<DieValue> rolled;
	std::vector<DieValue> completed;
	bool awaitingRoll{true};

	bool operator==(const DiceSnapshot&) const = default;
};

//! Dice of the current turn.
//! Tracks values still playable (pending), the original roll (rolled) and values spent this turn (completed).
class Dice {
public:
	Dice(); //!< Uses a UniformDieSource seeded from std::random_device.
	explicit Dice(std::unique_ptr<IDieSource> source);

	//! Throw two dice. Doubles expand to four values. Returns the rolled sequence.
	//! \throws InvariantError if the source returns a value outside the die range.
	std::vector<DieValue> roll();

	//! Move the first pending occurrence of value to completed.
	//! Returns nothing and changes nothing if value is not pending.
	std::optional<DiceToken> consume(DieValue value);

	//! Exact inverse of the consume() call that produced token.
	void returnValue(const DiceToken& token);

	void reset(); //!< Clear all values and wait for the next roll.

	DiceSnapshot snapshot() const;
	void restore(const DiceSnapshot& snapshot); //!< \throws InvariantError on a malformed snapshot.

	const std::vector<DieValue>& pending() const;
	const std::vector<DieValue>& rolled() const;
	const std::vector<DieValue>& completed() const;
	bool awaitingRoll() const;
	bool hasPending() const;

	//! Sequence roll() produces for two thrown values.
	static std::vector<DieValue> expandedRoll(DieValue first, DieValue second);

private:
	std::unique_ptr<IDieSource> m_source;

	std::vector<DieValue> m_pending;
	std::vector<DieValue> m_rolled;
	std::vector<DieValue> m_completed;
	bool m_awaitingRoll{true};
};

} // namespace minigam
