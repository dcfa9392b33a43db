// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "position.h"

#include "const.h"

Position Position::getAreaBase() const
{
	return Position(x & OTBM_TILE_AREA_MASK, y & OTBM_TILE_AREA_MASK, z);
}

bool Position::isInBounds(uint16_t width, uint16_t height) const
{
	return x < width && y < height && z <= MAX_FLOOR;
}

std::ostream& operator<<(std::ostream& os, const Position& pos)
{
	os << "( " << std::setw(5) << std::setfill('0') << pos.x;
	os << " / " << std::setw(5) << std::setfill('0') << pos.y;
	os << " / " << std::setw(3) << std::setfill('0') << static_cast<uint16_t>(pos.z);
	os << " )";
	return os;
}
