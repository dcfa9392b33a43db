// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include "const.h"
#include "position.h"

#include <algorithm>
#include <boost/variant.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class PropStream;
class PropWriteStream;
struct FormatContext;

enum Attr_ReadValue
{
	ATTR_READ_CONTINUE,
	ATTR_READ_ERROR,
	ATTR_READ_END,
};

enum ItemDecayState_t : uint8_t
{
	DECAYING_FALSE = 0,
	DECAYING_TRUE,
	DECAYING_PENDING,
};

// value of an OTBM_ATTR_ATTRIBUTE_MAP entry, alternatives are ordered like OTBM_AttributeMapType_t
class CustomAttribute
{
public:
	using Value = boost::variant<boost::blank, std::string, int32_t, float, bool, double>;

	CustomAttribute() = default;
	explicit CustomAttribute(const std::string& v) : value(v) {}
	explicit CustomAttribute(const char* v) : value(std::string(v)) {}
	explicit CustomAttribute(int32_t v) : value(v) {}
	explicit CustomAttribute(float v) : value(v) {}
	explicit CustomAttribute(bool v) : value(v) {}
	explicit CustomAttribute(double v) : value(v) {}

	template <typename T>
	const T* get() const
	{
		return boost::get<T>(&value);
	}

	OTBM_AttributeMapType_t getType() const { return static_cast<OTBM_AttributeMapType_t>(value.which()); }

	void serialize(PropWriteStream& propWriteStream) const;
	bool unserialize(PropStream& propStream);

	bool operator==(const CustomAttribute& other) const { return value == other.value; }

	Value value;
};

using CustomAttributeMap = std::vector<std::pair<std::string, CustomAttribute>>;

class Item;
using ItemVector = std::vector<Item>;

class Item
{
public:
	Item() = default;
	explicit Item(uint16_t id) : id(id) {}

	static constexpr uint16_t PLACEHOLDER_ID = 0;

	uint16_t getID() const { return id; }
	void setID(uint16_t newId) { id = newId; }

	// unknown ids are kept as placeholders that remember the raw id and its space
	bool isPlaceholder() const { return id == PLACEHOLDER_ID; }
	uint16_t getRawUnknownId() const { return rawUnknownId; }
	bool isRawClientId() const { return rawClientId; }
	void setPlaceholder(uint16_t rawId, bool clientSpace)
	{
		id = PLACEHOLDER_ID;
		rawUnknownId = rawId;
		rawClientId = clientSpace;
	}

	bool hasSubType() const { return subType.has_value(); }
	uint16_t getSubType() const { return subType.value_or(0); }
	void setSubType(uint16_t n) { subType = n; }
	void clearSubType() { subType.reset(); }

	uint16_t getActionId() const { return actionId; }
	void setActionId(uint16_t n) { actionId = n; }

	uint16_t getUniqueId() const { return uniqueId; }
	void setUniqueId(uint16_t n) { uniqueId = n; }

	const std::string& getText() const { return text; }
	void setText(const std::string& newText) { text = newText; }

	const std::string& getSpecialDescription() const { return specialDescription; }
	void setSpecialDescription(const std::string& desc) { specialDescription = desc; }

	const std::optional<Position>& getTeleportDestination() const { return teleportDestination; }
	void setTeleportDestination(const Position& pos) { teleportDestination = pos; }

	uint16_t getDepotId() const { return depotId; }
	void setDepotId(uint16_t n) { depotId = n; }

	uint8_t getDoorId() const { return doorId; }
	void setDoorId(uint8_t n) { doorId = n; }

	int32_t getDuration() const { return duration; }
	void setDuration(int32_t time) { duration = std::max<int32_t>(0, time); }

	ItemDecayState_t getDecaying() const { return decayState; }
	void setDecaying(ItemDecayState_t state) { decayState = state; }

	uint32_t getDate() const { return writtenDate; }
	void setDate(uint32_t n) { writtenDate = n; }

	const std::string& getWriter() const { return writer; }
	void setWriter(const std::string& name) { writer = name; }

	uint32_t getSleeper() const { return sleeperGUID; }
	void setSleeper(uint32_t guid) { sleeperGUID = guid; }

	uint32_t getSleepStart() const { return sleepStart; }
	void setSleepStart(uint32_t n) { sleepStart = n; }

	const CustomAttributeMap& getCustomAttributes() const { return customAttributes; }
	const CustomAttribute* getCustomAttribute(const std::string& key) const;
	void setCustomAttribute(const std::string& key, const CustomAttribute& value);

	const std::string& getUnknownAttributes() const { return unknownAttributes; }
	void setUnknownAttributes(const std::string& bytes) { unknownAttributes = bytes; }

	const ItemVector& getItems() const { return items; }
	ItemVector& getItems() { return items; }
	Item& addItem(Item&& item)
	{
		items.push_back(std::move(item));
		return items.back();
	}

	// true if the item can be written as a bare id
	bool isCompact() const { return !hasAttributes() && items.empty(); }
	bool hasAttributes() const;

	// number of items in this item's subtree, itself included
	uint32_t getTotalCount() const;

	bool readInlineSubType(PropStream& propStream, const FormatContext& context);
	void writeInlineSubType(PropWriteStream& propWriteStream, const FormatContext& context) const;

	Attr_ReadValue readAttr(OTBM_AttrTypes_t attr, PropStream& propStream);

	/// <summary>
	/// Reads the attribute list that follows the item id.
	/// On an unknown or malformed attribute the remaining bytes, tag included, are kept
	/// verbatim and written back by serializeAttr.
	/// </summary>
	/// <returns>False if an attribute could not be decoded.</returns>
	bool unserializeAttr(PropStream& propStream, uint8_t& failedAttr);

	// writes every known attribute, returns false if the format had no room for the attribute map
	bool serializeAttr(PropWriteStream& propWriteStream, const FormatContext& context) const;

	static bool isKnownAttribute(uint8_t attr);

	bool operator==(const Item& other) const = default;

private:
	std::string text;
	std::string specialDescription;
	std::string writer;
	std::string unknownAttributes;

	CustomAttributeMap customAttributes;
	ItemVector items;

	std::optional<Position> teleportDestination;
	std::optional<uint16_t> subType;

	int32_t duration = 0;
	uint32_t writtenDate = 0;
	uint32_t sleeperGUID = 0;
	uint32_t sleepStart = 0;

	uint16_t id = 0;
	uint16_t rawUnknownId = 0;
	uint16_t actionId = 0;
	uint16_t uniqueId = 0;
	uint16_t depotId = 0;

	uint8_t doorId = 0;
	ItemDecayState_t decayState = DECAYING_FALSE;
	bool rawClientId = false;
};
