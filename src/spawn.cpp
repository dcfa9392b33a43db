// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "spawn.h"

Position SpawnArea::getCreaturePosition(const spawnBlock_t& sb) const
{
	const int32_t x = std::clamp<int32_t>(centerPos.x + sb.offsetX, 0, std::numeric_limits<uint16_t>::max());
	const int32_t y = std::clamp<int32_t>(centerPos.y + sb.offsetY, 0, std::numeric_limits<uint16_t>::max());
	return Position(static_cast<uint16_t>(x), static_cast<uint16_t>(y), centerPos.z);
}
