// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "enums.h"
#include "position.h"

#include <optional>
#include <string>
#include <vector>

class ItemDatabase;
class Map;

struct ValidationIssue
{
	ValidationSeverity_t severity;
	ValidationCode_t code;
	std::string message;
	std::optional<Position> position;
};

class ValidationResult
{
public:
	void add(ValidationSeverity_t severity, ValidationCode_t code, const std::string& message,
	         const std::optional<Position>& position = std::nullopt)
	{
		issues.push_back({severity, code, message, position});
	}

	const std::vector<ValidationIssue>& getIssues() const { return issues; }

	size_t getErrorCount() const;
	size_t getWarningCount() const;
	bool hasErrors() const { return getErrorCount() != 0; }
	bool hasIssue(ValidationCode_t code) const;

private:
	std::vector<ValidationIssue> issues;
};

/**
 * Inspects an assembled map for dangling references and values outside the declared map size.
 * Never modifies the map.
 */
class MapValidator
{
public:
	static ValidationResult validate(const Map& map, const ItemDatabase* items = nullptr);
};
