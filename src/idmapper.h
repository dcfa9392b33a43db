// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <unordered_map>
#include <vector>

class ItemDatabase;

class UnmappedItemId final : public std::runtime_error
{
public:
	UnmappedItemId(uint16_t id, bool clientSpace);

	uint16_t getId() const { return id; }
	bool isClientId() const { return clientSpace; }

private:
	uint16_t id;
	bool clientSpace;
};

/**
 * Bidirectional ServerID <-> ClientID translation, built once per session.
 *
 * Only pairs that survive in both directions are kept: when several server ids
 * share a client id the lowest one owns it and the others are reported as
 * ambiguous, so clientToServer(serverToClient(id)) == id for every mapped id.
 */
class IdMapper
{
public:
	IdMapper() = default;
	explicit IdMapper(const ItemDatabase& items);

	void addPair(uint16_t serverId, uint16_t clientId);

	bool serverToClient(uint16_t serverId, uint16_t& clientId) const;
	bool clientToServer(uint16_t clientId, uint16_t& serverId) const;

	uint16_t requireClientId(uint16_t serverId) const;
	uint16_t requireServerId(uint16_t clientId) const;

	bool hasServerId(uint16_t serverId) const { return serverToClientMap.find(serverId) != serverToClientMap.end(); }
	bool hasClientId(uint16_t clientId) const { return clientToServerMap.find(clientId) != clientToServerMap.end(); }

	size_t size() const { return serverToClientMap.size(); }
	bool empty() const { return serverToClientMap.empty(); }

	const std::vector<uint16_t>& getAmbiguousServerIds() const { return ambiguousServerIds; }

private:
	std::unordered_map<uint16_t, uint16_t> serverToClientMap;
	std::unordered_map<uint16_t, uint16_t> clientToServerMap;
	std::vector<uint16_t> ambiguousServerIds;
};
