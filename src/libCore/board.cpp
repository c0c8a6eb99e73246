#include "core/board.hpp"
#include "core/errors.hpp"

#include <cstddef>
#include <format>

namespace minigam {

static std::size_t slot(const Player player) {
	return player == Player::Human ? 0u : 1u;
}

static Player toPlayer(const Board::Owner owner) {
	return owner == Board::Owner::Human ? Player::Human : Player::Ai;
}

static void requireOnBoard(const PointId pointNumber) {
	if (!withinBoard(pointNumber)) {
		throw ValidationError(std::format("Point {} out of range.", pointNumber));
	}
}

Board::Board() {
	reset();
}

void Board::reset() {
	m_points.fill(Point{});
	m_bar.fill(kCheckersPerPlayer);
	m_borneOff.fill(0u);
}

const Board::Point& Board::point(const PointId pointNumber) const {
	requireOnBoard(pointNumber);
	return m_points[static_cast<std::size_t>(pointNumber - 1)];
}

Board::Point& Board::at(const PointId pointNumber) {
	requireOnBoard(pointNumber);
	return m_points[static_cast<std::size_t>(pointNumber - 1)];
}

unsigned Board::bar(const Player player) const {
	return m_bar[slot(player)];
}

unsigned Board::borneOff(const Player player) const {
	return m_borneOff[slot(player)];
}

unsigned Board::checkerCount(const Player player) const {
	unsigned total = m_bar[slot(player)] + m_borneOff[slot(player)];
	for (const auto& p: m_points) {
		if (p.owner == toOwner(player)) {
			total += p.count;
		}
	}
	return total;
}

bool Board::isPointOpen(const Player player, const PointId targetPoint) const {
	if (!withinBoard(targetPoint)) {
		return false;
	}

	const auto& target = point(targetPoint);
	if (target.owner == Owner::None || target.owner == toOwner(player)) {
		return true;
	}
	return target.count == 1;
}

void Board::enterFromBar(const PointId targetPoint, const Player player) {
	requireOnBoard(targetPoint);
	if (m_bar[slot(player)] == 0) {
		throw ValidationError("No checker on the bar.");
	}
	if (!isPointOpen(player, targetPoint)) {
		throw ValidationError(std::format("Point {} blocked.", targetPoint));
	}

	--m_bar[slot(player)];
	applyHit(targetPoint, player);
	occupy(targetPoint, player);
}

void Board::moveChecker(const PointId originPoint, const PointId targetPoint, const Player player) {
	requireOnBoard(originPoint);
	requireOnBoard(targetPoint);

	auto& origin = at(originPoint);
	if (origin.owner != toOwner(player) || origin.count == 0) {
		throw ValidationError(std::format("No {} checker on point {}.", toString(player), originPoint));
	}
	if (!isPointOpen(player, targetPoint)) {
		throw ValidationError(std::format("Point {} blocked.", targetPoint));
	}

	if (--origin.count == 0) {
		origin.owner = Owner::None;
	}
	applyHit(targetPoint, player);
	occupy(targetPoint, player);
}

void Board::bearOff(const PointId pointNumber, const Player player) {
	requireOnBoard(pointNumber);

	auto& p = at(pointNumber);
	if (p.owner != toOwner(player) || p.count == 0) {
		throw ValidationError(std::format("No checker to bear off from point {}.", pointNumber));
	}

	if (--p.count == 0) {
		p.owner = Owner::None;
	}
	++m_borneOff[slot(player)];
}

void Board::applyHit(const PointId targetPoint, const Player player) {
	auto& target = at(targetPoint);
	if (target.owner != Owner::None && target.owner != toOwner(player) && target.count == 1) {
		++m_bar[slot(toPlayer(target.owner))];
		target = Point{};
	}
}

void Board::occupy(const PointId targetPoint, const Player player) {
	auto& target = at(targetPoint);
	target.owner = toOwner(player);
	++target.count;
}

} // namespace minigam
