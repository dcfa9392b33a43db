// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <functional>
#include <ostream>

struct Position
{
	constexpr Position() = default;
	constexpr Position(uint16_t x, uint16_t y, uint8_t z) : x(x), y(y), z(z) {}

	uint16_t x = 0;
	uint16_t y = 0;
	uint8_t z = 0;

	bool operator<(const Position& p) const
	{
		if (z < p.z) {
			return true;
		}

		if (z > p.z) {
			return false;
		}

		if (y < p.y) {
			return true;
		}

		if (y > p.y) {
			return false;
		}

		if (x < p.x) {
			return true;
		}

		return false;
	}

	bool operator>(const Position& p) const { return p < *this; }

	bool operator==(const Position& p) const { return p.x == x && p.y == y && p.z == z; }

	bool operator!=(const Position& p) const { return p.x != x || p.y != y || p.z != z; }

	Position operator+(const Position& p1) const { return Position(x + p1.x, y + p1.y, z + p1.z); }

	Position operator-(const Position& p1) const { return Position(x - p1.x, y - p1.y, z - p1.z); }

	// tile area this position belongs to
	Position getAreaBase() const;
	// whether the position lies inside a map of the given size and a valid floor
	bool isInBounds(uint16_t width, uint16_t height) const;

	static constexpr uint8_t MAX_FLOOR = 15;
};

namespace std {
template <>
struct hash<Position>
{
	std::size_t operator()(const Position& p) const
	{
		return static_cast<std::size_t>(static_cast<uint64_t>(p.x) | (static_cast<uint64_t>(p.y) << 16) |
		                                (static_cast<uint64_t>(p.z) << 32));
	}
};
} // namespace std

std::ostream& operator<<(std::ostream&, const Position&);
