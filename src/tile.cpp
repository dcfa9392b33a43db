// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "tile.h"

uint32_t Tile::getTotalItemCount() const
{
	uint32_t count = ground ? ground->getTotalCount() : 0;
	for (const Item& item : items) {
		count += item.getTotalCount();
	}
	return count;
}
