// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "enums.h"

#include <istream>
#include <string>

// sniffs the leading bytes, the stream position is restored afterwards
MapFileKind_t detectMapFile(std::istream& stream);
MapFileKind_t detectMapFile(const std::string& fileName);

const char* getMapFileKindName(MapFileKind_t kind);
inline bool isOTBMFileKind(MapFileKind_t kind)
{
	return kind == MAP_FILE_OTBM || kind == MAP_FILE_OTBM_NO_IDENTIFIER;
}
