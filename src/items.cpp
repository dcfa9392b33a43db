// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "items.h"

#include "fileloader.h"
#include "pugicast.h"
#include "resourceguard.h"
#include "tools.h"

#include <pugixml.hpp>
#include <unordered_map>

namespace {

const OTB::Identifier itemsIdentifier = {{'O', 'T', 'B', 'I'}};

bool readRootVersion(PropStream& stream, ItemsOtbVersion& version, std::string& error)
{
	uint32_t flags;
	if (!stream.read<uint32_t>(flags)) {
		error = "Could not read root flags.";
		return false;
	}

	uint8_t attr;
	if (!stream.read<uint8_t>(attr) || attr != ROOT_ATTR_VERSION) {
		// very old files carry no version block at all
		return true;
	}

	uint16_t datalen;
	if (!stream.read<uint16_t>(datalen) || datalen != sizeof(VERSIONINFO)) {
		error = "Invalid version block length.";
		return false;
	}

	VERSIONINFO vi;
	if (!stream.read(vi)) {
		error = "Could not read version block.";
		return false;
	}

	version.majorVersion = vi.dwMajorVersion;
	version.minorVersion = vi.dwMinorVersion;
	version.buildNumber = vi.dwBuildNumber;

	const char* csd = reinterpret_cast<const char*>(vi.CSDVersion);
	version.csdVersion.assign(csd, strnlen(csd, sizeof(vi.CSDVersion)));
	return true;
}

std::unordered_map<std::string, std::string> readAttributeChildren(const pugi::xml_node& itemNode)
{
	std::unordered_map<std::string, std::string> attributes;
	for (auto attributeNode : itemNode.children("attribute")) {
		pugi::xml_attribute keyAttribute = attributeNode.attribute("key");
		pugi::xml_attribute valueAttribute = attributeNode.attribute("value");
		if (!keyAttribute || !valueAttribute) {
			continue;
		}

		attributes.emplace(asLowerCaseString(keyAttribute.as_string()), valueAttribute.as_string());
	}
	return attributes;
}

} // namespace

ItemType& ItemDatabase::addItemType(uint16_t id)
{
	ItemType& itemType = items[id];
	itemType.id = id;
	return itemType;
}

const ItemType* ItemDatabase::getItemType(uint16_t id) const
{
	auto it = items.find(id);
	if (it == items.end()) {
		return nullptr;
	}
	return &it->second;
}

bool ItemDatabase::readOtbVersion(const std::string& file, ItemsOtbVersion& version)
{
	std::ifstream stream(file, std::ios::binary);
	if (!stream.is_open()) {
		return false;
	}

	try {
		OTB::Loader loader{stream, itemsIdentifier};
		loader.enterRoot();

		PropStream props;
		if (!loader.getProps(props)) {
			return false;
		}

		std::string error;
		return readRootVersion(props, version, error);
	} catch (const OTB::InvalidOTBFormat&) {
		return false;
	} catch (const ResourceLimitError&) {
		return false;
	}
}

bool ItemDatabase::loadFromOtb(const std::string& file)
{
	std::ifstream stream(file, std::ios::binary);
	if (!stream.is_open()) {
		lastError = fmt::format("Could not open {:s}.", file);
		return false;
	}
	return loadFromOtb(stream);
}

bool ItemDatabase::loadFromOtb(std::istream& stream)
{
	try {
		OTB::Loader loader{stream, itemsIdentifier};
		loader.enterRoot();

		PropStream props;
		if (!loader.getProps(props) || !readRootVersion(props, otbVersion, lastError)) {
			if (lastError.empty()) {
				lastError = "Could not read root property.";
			}
			return false;
		}

		uint8_t group;
		while (loader.nextChild(group)) {
			PropStream stream;
			if (!loader.getProps(stream)) {
				lastError = "Could not read item node.";
				return false;
			}

			uint32_t flags;
			if (!stream.read<uint32_t>(flags)) {
				lastError = "Could not read item flags.";
				return false;
			}

			uint16_t serverId = 0;
			uint16_t clientId = 0;
			uint8_t alwaysOnTopOrder = 0;
			std::string name;

			uint8_t attrib;
			while (stream.read<uint8_t>(attrib)) {
				uint16_t datalen;
				if (!stream.read<uint16_t>(datalen)) {
					lastError = "Could not read item attribute length.";
					return false;
				}

				switch (attrib) {
					case ITEM_ATTR_SERVERID: {
						if (datalen != sizeof(uint16_t) || !stream.read<uint16_t>(serverId)) {
							lastError = "Invalid server id attribute.";
							return false;
						}
						break;
					}

					case ITEM_ATTR_CLIENTID: {
						if (datalen != sizeof(uint16_t) || !stream.read<uint16_t>(clientId)) {
							lastError = "Invalid client id attribute.";
							return false;
						}
						break;
					}

					case ITEM_ATTR_NAME: {
						if (!stream.readBytes(name, datalen)) {
							lastError = "Invalid name attribute.";
							return false;
						}
						break;
					}

					case ITEM_ATTR_TOPORDER: {
						if (datalen != sizeof(uint8_t) || !stream.read<uint8_t>(alwaysOnTopOrder)) {
							lastError = "Invalid top order attribute.";
							return false;
						}
						break;
					}

					default: {
						if (!stream.skip(datalen)) {
							lastError = fmt::format("Invalid item attribute {:d}.", attrib);
							return false;
						}
						break;
					}
				}
			}

			loader.leaveNode();

			if (serverId == 0 || group == ITEM_GROUP_DEPRECATED || group >= ITEM_GROUP_LAST) {
				continue;
			}

			ItemType& iType = addItemType(serverId);
			iType.group = static_cast<itemgroup_t>(group);
			iType.flags = flags;
			iType.clientId = clientId;
			iType.stackable = hasBitSet(FLAG_STACKABLE, flags);
			iType.alwaysOnTop = hasBitSet(FLAG_ALWAYSONTOP, flags);
			iType.alwaysOnTopOrder = alwaysOnTopOrder;
			iType.charges = hasBitSet(FLAG_CLIENTCHARGES, flags);
			if (!name.empty()) {
				iType.name = name;
			}
		}

		loader.leaveNode();
	} catch (const OTB::InvalidOTBFormat& err) {
		lastError = err.what();
		return false;
	} catch (const ResourceLimitError& err) {
		lastError = err.what();
		return false;
	}
	return true;
}

bool ItemDatabase::loadFromXml(const std::string& file)
{
	pugi::xml_document doc;
	pugi::xml_parse_result result = doc.load_file(file.c_str());
	if (!result) {
		printXMLError("Error - ItemDatabase::loadFromXml", file, result, lastError);
		return false;
	}

	for (auto itemNode : doc.child("items").children("item")) {
		pugi::xml_attribute idAttribute = itemNode.attribute("id");
		if (idAttribute) {
			parseItemNode(itemNode, pugi::cast<uint16_t>(idAttribute.value()));
			continue;
		}

		pugi::xml_attribute fromIdAttribute = itemNode.attribute("fromid");
		pugi::xml_attribute toIdAttribute = itemNode.attribute("toid");
		if (!fromIdAttribute || !toIdAttribute) {
			continue;
		}

		uint16_t id = pugi::cast<uint16_t>(fromIdAttribute.value());
		uint16_t toId = pugi::cast<uint16_t>(toIdAttribute.value());
		while (id <= toId) {
			parseItemNode(itemNode, id);
			if (id == std::numeric_limits<uint16_t>::max()) {
				break;
			}
			++id;
		}
	}
	return true;
}

void ItemDatabase::parseItemNode(const pugi::xml_node& itemNode, uint16_t id)
{
	if (id == 0) {
		return;
	}

	ItemType& it = addItemType(id);

	if (pugi::xml_attribute nameAttribute = itemNode.attribute("name")) {
		it.name = nameAttribute.as_string();
	}

	if (pugi::xml_attribute articleAttribute = itemNode.attribute("article")) {
		it.article = articleAttribute.as_string();
	}

	const auto attributes = readAttributeChildren(itemNode);

	// items.otb is authoritative for client ids, items.xml only fills gaps
	if (it.clientId == 0) {
		uint16_t clientId = 0;
		if (pugi::xml_attribute clientIdAttribute = itemNode.attribute("clientid")) {
			clientId = pugi::cast<uint16_t>(clientIdAttribute.value());
		} else if (auto attr = attributes.find("clientid"); attr != attributes.end()) {
			clientId = pugi::cast<uint16_t>(attr->second.c_str());
		}

		if (clientId != 0) {
			if (pugi::xml_attribute fromIdAttribute = itemNode.attribute("fromid")) {
				clientId += id - pugi::cast<uint16_t>(fromIdAttribute.value());
			}
			it.clientId = clientId;
		}
	}

	if (auto attr = attributes.find("type"); attr != attributes.end()) {
		const std::string type = asLowerCaseString(attr->second);
		if (type == "ground") {
			it.group = ITEM_GROUP_GROUND;
		} else if (type == "container") {
			it.group = ITEM_GROUP_CONTAINER;
		} else if (type == "teleport") {
			it.group = ITEM_GROUP_TELEPORT;
		} else if (type == "door") {
			it.group = ITEM_GROUP_DOOR;
		} else if (type == "magicfield") {
			it.group = ITEM_GROUP_MAGICFIELD;
		} else if (type == "key") {
			it.group = ITEM_GROUP_KEY;
		}
	}

	if (auto attr = attributes.find("stackable"); attr != attributes.end()) {
		it.stackable = booleanString(attr->second);
	}

	if (auto attr = attributes.find("fluidcontainer"); attr != attributes.end() && booleanString(attr->second)) {
		it.group = ITEM_GROUP_FLUID;
	}

	auto splash = attributes.find("issplash");
	if (splash == attributes.end()) {
		splash = attributes.find("splash");
	}
	if (splash != attributes.end() && booleanString(splash->second)) {
		it.group = ITEM_GROUP_SPLASH;
	}

	if (auto attr = attributes.find("charges"); attr != attributes.end()) {
		it.charges = pugi::cast<uint32_t>(attr->second.c_str()) != 0;
	}
}
