// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "enums.h"

#include <cstdint>
#include <string>
#include <type_traits>

namespace pugi {
struct xml_parse_result;
}

void printXMLError(const std::string& where, const std::string& fileName, const pugi::xml_parse_result& result,
                   std::string& error);

void toLowerCaseString(std::string& source);
std::string asLowerCaseString(std::string source);

constexpr bool hasBitSet(uint32_t flag, uint32_t flags) { return (flags & flag) != 0; }

bool booleanString(const std::string& str);

std::string formatBytes(uint64_t bytes);

const char* getMapIOErrorName(MapIOError_t error);
const char* getMapWarningName(MapWarningCode_t code);
const char* getValidationCodeName(ValidationCode_t code);

namespace otmapio {

template <typename E>
constexpr auto to_underlying(E e) noexcept
{
	return static_cast<std::underlying_type_t<E>>(e);
}

} // namespace otmapio
