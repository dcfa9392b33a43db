// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "item.h"

#include "fileloader.h"
#include "items.h"
#include "mapversion.h"

namespace {

struct SerializeVisitor : public boost::static_visitor<>
{
	explicit SerializeVisitor(PropWriteStream& propWriteStream) : propWriteStream(propWriteStream) {}

	void operator()(const boost::blank&) const {}

	void operator()(const std::string& v) const { propWriteStream.writeLongString(v); }

	void operator()(bool v) const { propWriteStream.write<uint8_t>(v ? 1 : 0); }

	template <typename T>
	void operator()(const T& v) const
	{
		propWriteStream.write<T>(v);
	}

	PropWriteStream& propWriteStream;
};

const ItemType* findItemType(const FormatContext& context, uint16_t id)
{
	if (!context.items) {
		return nullptr;
	}
	return context.items->getItemType(id);
}

} // namespace

void CustomAttribute::serialize(PropWriteStream& propWriteStream) const
{
	propWriteStream.write<uint8_t>(getType());
	boost::apply_visitor(SerializeVisitor(propWriteStream), value);
}

bool CustomAttribute::unserialize(PropStream& propStream)
{
	uint8_t type;
	if (!propStream.read<uint8_t>(type)) {
		return false;
	}

	switch (type) {
		case OTBM_ATTRMAP_NONE: {
			value = boost::blank();
			break;
		}

		case OTBM_ATTRMAP_STRING: {
			std::string tmp;
			if (!propStream.readLongString(tmp)) {
				return false;
			}
			value = tmp;
			break;
		}

		case OTBM_ATTRMAP_INTEGER: {
			int32_t tmp;
			if (!propStream.read<int32_t>(tmp)) {
				return false;
			}
			value = tmp;
			break;
		}

		case OTBM_ATTRMAP_FLOAT: {
			float tmp;
			if (!propStream.read<float>(tmp)) {
				return false;
			}
			value = tmp;
			break;
		}

		case OTBM_ATTRMAP_BOOLEAN: {
			uint8_t tmp;
			if (!propStream.read<uint8_t>(tmp)) {
				return false;
			}
			value = tmp != 0;
			break;
		}

		case OTBM_ATTRMAP_DOUBLE: {
			double tmp;
			if (!propStream.read<double>(tmp)) {
				return false;
			}
			value = tmp;
			break;
		}

		default:
			return false;
	}
	return true;
}

const CustomAttribute* Item::getCustomAttribute(const std::string& key) const
{
	auto it = std::find_if(customAttributes.begin(), customAttributes.end(),
	                       [&key](const auto& entry) { return entry.first == key; });
	if (it == customAttributes.end()) {
		return nullptr;
	}
	return &it->second;
}

void Item::setCustomAttribute(const std::string& key, const CustomAttribute& value)
{
	auto it = std::find_if(customAttributes.begin(), customAttributes.end(),
	                       [&key](const auto& entry) { return entry.first == key; });
	if (it != customAttributes.end()) {
		it->second = value;
		return;
	}
	customAttributes.emplace_back(key, value);
}

bool Item::hasAttributes() const
{
	return subType || actionId != 0 || uniqueId != 0 || !text.empty() || !specialDescription.empty() ||
	       teleportDestination || depotId != 0 || doorId != 0 || duration != 0 || decayState != DECAYING_FALSE ||
	       writtenDate != 0 || !writer.empty() || sleeperGUID != 0 || sleepStart != 0 || !customAttributes.empty() ||
	       !unknownAttributes.empty();
}

uint32_t Item::getTotalCount() const
{
	uint32_t count = 0;
	std::vector<const Item*> pending{this};
	while (!pending.empty()) {
		const Item* item = pending.back();
		pending.pop_back();

		++count;
		for (const Item& child : item->items) {
			pending.push_back(&child);
		}
	}
	return count;
}

bool Item::readInlineSubType(PropStream& propStream, const FormatContext& context)
{
	if (!context.format.hasInlineSubType()) {
		return true;
	}

	const ItemType* iType = findItemType(context, id);
	if (!iType || !iType->hasSubType()) {
		return true;
	}

	uint8_t count;
	if (!propStream.read<uint8_t>(count)) {
		return false;
	}

	setSubType(count);
	return true;
}

void Item::writeInlineSubType(PropWriteStream& propWriteStream, const FormatContext& context) const
{
	if (!context.format.hasInlineSubType()) {
		return;
	}

	// the reader expects the byte whenever the type carries a subtype
	const ItemType* iType = findItemType(context, id);
	if (iType && iType->hasSubType()) {
		propWriteStream.write<uint8_t>(static_cast<uint8_t>(std::min<uint16_t>(getSubType(), 0xFF)));
	}
}

bool Item::isKnownAttribute(uint8_t attr)
{
	switch (attr) {
		case OTBM_ATTR_COUNT:
		case OTBM_ATTR_RUNE_CHARGES:
		case OTBM_ATTR_CHARGES:
		case OTBM_ATTR_ACTION_ID:
		case OTBM_ATTR_UNIQUE_ID:
		case OTBM_ATTR_TEXT:
		case OTBM_ATTR_DESC:
		case OTBM_ATTR_TELE_DEST:
		case OTBM_ATTR_DEPOT_ID:
		case OTBM_ATTR_HOUSEDOORID:
		case OTBM_ATTR_DURATION:
		case OTBM_ATTR_DECAYING_STATE:
		case OTBM_ATTR_WRITTENDATE:
		case OTBM_ATTR_WRITTENBY:
		case OTBM_ATTR_SLEEPERGUID:
		case OTBM_ATTR_SLEEPSTART:
		case OTBM_ATTR_ATTRIBUTE_MAP:
			return true;
		default:
			return false;
	}
}

Attr_ReadValue Item::readAttr(OTBM_AttrTypes_t attr, PropStream& propStream)
{
	switch (attr) {
		case OTBM_ATTR_COUNT:
		case OTBM_ATTR_RUNE_CHARGES: {
			uint8_t count;
			if (!propStream.read<uint8_t>(count)) {
				return ATTR_READ_ERROR;
			}

			setSubType(count);
			break;
		}

		case OTBM_ATTR_CHARGES: {
			uint16_t charges;
			if (!propStream.read<uint16_t>(charges)) {
				return ATTR_READ_ERROR;
			}

			setSubType(charges);
			break;
		}

		case OTBM_ATTR_ACTION_ID: {
			uint16_t aid;
			if (!propStream.read<uint16_t>(aid)) {
				return ATTR_READ_ERROR;
			}

			setActionId(aid);
			break;
		}

		case OTBM_ATTR_UNIQUE_ID: {
			uint16_t uid;
			if (!propStream.read<uint16_t>(uid)) {
				return ATTR_READ_ERROR;
			}

			setUniqueId(uid);
			break;
		}

		case OTBM_ATTR_TEXT: {
			std::string str;
			if (!propStream.readString(str)) {
				return ATTR_READ_ERROR;
			}

			setText(str);
			break;
		}

		case OTBM_ATTR_DESC: {
			std::string str;
			if (!propStream.readString(str)) {
				return ATTR_READ_ERROR;
			}

			setSpecialDescription(str);
			break;
		}

		case OTBM_ATTR_TELE_DEST: {
			OTBM_Destination_coords dest_coords;
			if (!propStream.read(dest_coords)) {
				return ATTR_READ_ERROR;
			}

			setTeleportDestination(Position(dest_coords.x, dest_coords.y, dest_coords.z));
			break;
		}

		case OTBM_ATTR_DEPOT_ID: {
			uint16_t depotId;
			if (!propStream.read<uint16_t>(depotId)) {
				return ATTR_READ_ERROR;
			}

			setDepotId(depotId);
			break;
		}

		case OTBM_ATTR_HOUSEDOORID: {
			uint8_t doorId;
			if (!propStream.read<uint8_t>(doorId)) {
				return ATTR_READ_ERROR;
			}

			setDoorId(doorId);
			break;
		}

		case OTBM_ATTR_DURATION: {
			int32_t time;
			if (!propStream.read<int32_t>(time)) {
				return ATTR_READ_ERROR;
			}

			setDuration(time);
			break;
		}

		case OTBM_ATTR_DECAYING_STATE: {
			uint8_t state;
			if (!propStream.read<uint8_t>(state)) {
				return ATTR_READ_ERROR;
			}

			if (state != DECAYING_FALSE) {
				setDecaying(state == DECAYING_TRUE ? DECAYING_TRUE : DECAYING_PENDING);
			}
			break;
		}

		case OTBM_ATTR_WRITTENDATE: {
			uint32_t date;
			if (!propStream.read<uint32_t>(date)) {
				return ATTR_READ_ERROR;
			}

			setDate(date);
			break;
		}

		case OTBM_ATTR_WRITTENBY: {
			std::string name;
			if (!propStream.readString(name)) {
				return ATTR_READ_ERROR;
			}

			setWriter(name);
			break;
		}

		case OTBM_ATTR_SLEEPERGUID: {
			uint32_t guid;
			if (!propStream.read<uint32_t>(guid)) {
				return ATTR_READ_ERROR;
			}

			setSleeper(guid);
			break;
		}

		case OTBM_ATTR_SLEEPSTART: {
			uint32_t sleep_start;
			if (!propStream.read<uint32_t>(sleep_start)) {
				return ATTR_READ_ERROR;
			}

			setSleepStart(sleep_start);
			break;
		}

		case OTBM_ATTR_ATTRIBUTE_MAP: {
			uint16_t size;
			if (!propStream.read<uint16_t>(size)) {
				return ATTR_READ_ERROR;
			}

			for (uint16_t i = 0; i < size; ++i) {
				std::string key;
				if (!propStream.readString(key)) {
					return ATTR_READ_ERROR;
				}

				CustomAttribute val;
				if (!val.unserialize(propStream)) {
					return ATTR_READ_ERROR;
				}

				setCustomAttribute(key, val);
			}
			break;
		}

		default:
			return ATTR_READ_ERROR;
	}

	return ATTR_READ_CONTINUE;
}

bool Item::unserializeAttr(PropStream& propStream, uint8_t& failedAttr)
{
	while (propStream.size() > 0) {
		const size_t mark = propStream.tell();

		uint8_t attr_type;
		propStream.read<uint8_t>(attr_type);

		Attr_ReadValue ret = readAttr(static_cast<OTBM_AttrTypes_t>(attr_type), propStream);
		if (ret == ATTR_READ_ERROR) {
			failedAttr = attr_type;
			propStream.seek(mark);
			propStream.readRemainder(unknownAttributes);
			return false;
		} else if (ret == ATTR_READ_END) {
			return true;
		}
	}
	return true;
}

bool Item::serializeAttr(PropWriteStream& propWriteStream, const FormatContext& context) const
{
	if (subType) {
		const ItemType* iType = findItemType(context, id);
		const bool inline_subtype = context.format.hasInlineSubType() && iType && iType->hasSubType();
		if (inline_subtype) {
			// already written by writeInlineSubType
		} else if (*subType > 0xFF || (iType && iType->hasCharges())) {
			propWriteStream.write<uint8_t>(OTBM_ATTR_CHARGES);
			propWriteStream.write<uint16_t>(*subType);
		} else if (!inline_subtype) {
			propWriteStream.write<uint8_t>(OTBM_ATTR_COUNT);
			propWriteStream.write<uint8_t>(static_cast<uint8_t>(*subType));
		}
	}

	if (actionId != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_ACTION_ID);
		propWriteStream.write<uint16_t>(actionId);
	}

	if (uniqueId != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_UNIQUE_ID);
		propWriteStream.write<uint16_t>(uniqueId);
	}

	if (!text.empty()) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_TEXT);
		propWriteStream.writeString(text);
	}

	if (writtenDate != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_WRITTENDATE);
		propWriteStream.write<uint32_t>(writtenDate);
	}

	if (!writer.empty()) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_WRITTENBY);
		propWriteStream.writeString(writer);
	}

	if (!specialDescription.empty()) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_DESC);
		propWriteStream.writeString(specialDescription);
	}

	if (teleportDestination) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_TELE_DEST);
		propWriteStream.write<uint16_t>(teleportDestination->x);
		propWriteStream.write<uint16_t>(teleportDestination->y);
		propWriteStream.write<uint8_t>(teleportDestination->z);
	}

	if (depotId != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_DEPOT_ID);
		propWriteStream.write<uint16_t>(depotId);
	}

	if (doorId != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_HOUSEDOORID);
		propWriteStream.write<uint8_t>(doorId);
	}

	if (duration != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_DURATION);
		propWriteStream.write<int32_t>(duration);
	}

	if (decayState != DECAYING_FALSE) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_DECAYING_STATE);
		propWriteStream.write<uint8_t>(decayState);
	}

	if (sleeperGUID != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_SLEEPERGUID);
		propWriteStream.write<uint32_t>(sleeperGUID);
	}

	if (sleepStart != 0) {
		propWriteStream.write<uint8_t>(OTBM_ATTR_SLEEPSTART);
		propWriteStream.write<uint32_t>(sleepStart);
	}

	bool complete = true;
	if (!customAttributes.empty()) {
		if (context.format.hasAttributeMap()) {
			propWriteStream.write<uint8_t>(OTBM_ATTR_ATTRIBUTE_MAP);
			propWriteStream.write<uint16_t>(static_cast<uint16_t>(std::min<size_t>(customAttributes.size(), 0xFFFF)));

			size_t written = 0;
			for (const auto& entry : customAttributes) {
				if (written++ == 0xFFFF) {
					break;
				}

				propWriteStream.writeString(entry.first);
				entry.second.serialize(propWriteStream);
			}
		} else {
			complete = false;
		}
	}

	// bytes this engine could not decode go back exactly where they came from, after the known ones
	propWriteStream.writeBytes(unknownAttributes);
	return complete;
}
