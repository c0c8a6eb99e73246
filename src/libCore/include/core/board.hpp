#pragma once

#include "core/types.hpp"

#include <array>

namespace minigam {

//! Six points, the two bars and the two borne off trays.
//! Every mutation validates first and throws ValidationError without touching the board when the request is illegal.
class Board {
public:
	//! Possible ownership values of points on the board.
	enum class Owner { None = 0, Human = static_cast<int>(Player::Human), Ai = static_cast<int>(Player::Ai) };

	struct Point {
		Owner owner{Owner::None};
		unsigned count{0}; //!< count == 0 <=> owner == None.

		bool operator==(const Point&) const = default;
	};

public:
	Board(); //!< Initial position: every checker on its bar.

	void reset();

	const Point& point(PointId pointNumber) const; //!< Point at pointNumber \in [1, kPointCount]
	unsigned bar(Player player) const;
	unsigned borneOff(Player player) const;
	unsigned checkerCount(Player player) const; //!< bar + points + borne off. Always kCheckersPerPlayer.

	bool isPointOpen(Player player, PointId targetPoint) const; //!< Empty, own or a single opposing checker.

	void enterFromBar(PointId targetPoint, Player player);
	void moveChecker(PointId originPoint, PointId targetPoint, Player player);
	void bearOff(PointId pointNumber, Player player);

	bool operator==(const Board&) const = default;

private:
	Point& at(PointId pointNumber);
	void applyHit(PointId targetPoint, Player player); //!< Send an opposing blot on targetPoint to its bar.
	void occupy(PointId targetPoint, Player player);

private:
	std::array<Point, kPointCount> m_points{};
	std::array<unsigned, 2> m_bar{kCheckersPerPlayer, kCheckersPerPlayer};
	std::array<unsigned, 2> m_borneOff{0u, 0u};
};

//! Returns the Board::Owner enum value of input player.
inline constexpr Board::Owner toOwner(Player player) {
	return player == Player::Human ? Board::Owner::Human : Board::Owner::Ai;
}

} // namespace minigam
