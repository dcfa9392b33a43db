// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "mapdetection.h"

#include "fileloader.h"

MapFileKind_t detectMapFile(std::istream& stream)
{
	const std::streampos start = stream.tellg();

	char magic[4] = {};
	stream.read(magic, sizeof(magic));
	const std::streamsize length = stream.gcount();

	stream.clear();
	if (start != std::streampos(-1)) {
		stream.seekg(start);
	}

	if (length == 0) {
		return MAP_FILE_EMPTY;
	}

	if (static_cast<uint8_t>(magic[0]) == OTB::START) {
		return MAP_FILE_OTBM_NO_IDENTIFIER;
	}

	if (length == 4) {
		if (std::memcmp(magic, "OTBM", 4) == 0 || std::memcmp(magic, "\0\0\0\0", 4) == 0) {
			return MAP_FILE_OTBM;
		}

		if (std::memcmp(magic, "OTMM", 4) == 0) {
			return MAP_FILE_OTMM;
		}
	}

	// text formats may start with whitespace
	size_t i = 0;
	while (i < static_cast<size_t>(length) && std::isspace(static_cast<unsigned char>(magic[i]))) {
		++i;
	}

	if (i < static_cast<size_t>(length)) {
		if (magic[i] == '<') {
			return MAP_FILE_XML;
		} else if (magic[i] == '{') {
			return MAP_FILE_JSON;
		}
	}
	return MAP_FILE_UNKNOWN;
}

MapFileKind_t detectMapFile(const std::string& fileName)
{
	std::ifstream file(fileName, std::ios::binary);
	if (!file.is_open()) {
		return MAP_FILE_UNKNOWN;
	}
	return detectMapFile(file);
}

const char* getMapFileKindName(MapFileKind_t kind)
{
	switch (kind) {
		case MAP_FILE_OTBM:
			return "OTBM";
		case MAP_FILE_OTBM_NO_IDENTIFIER:
			return "OTBM (no identifier)";
		case MAP_FILE_OTMM:
			return "OTMM";
		case MAP_FILE_XML:
			return "XML";
		case MAP_FILE_JSON:
			return "JSON";
		case MAP_FILE_EMPTY:
			return "empty file";
		default:
			return "unknown";
	}
}
