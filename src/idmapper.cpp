// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "idmapper.h"

#include "items.h"

UnmappedItemId::UnmappedItemId(uint16_t id, bool clientSpace) :
    std::runtime_error(fmt::format("{:s} id {:d} has no {:s} counterpart.", clientSpace ? "Client" : "Server", id,
                                   clientSpace ? "server" : "client")),
    id(id),
    clientSpace(clientSpace)
{}

IdMapper::IdMapper(const ItemDatabase& items)
{
	// item types are ordered by server id, so the lowest server id wins a shared client id
	for (const auto& it : items.getItemTypes()) {
		const ItemType& iType = it.second;
		if (iType.clientId != 0) {
			addPair(iType.id, iType.clientId);
		}
	}
}

void IdMapper::addPair(uint16_t serverId, uint16_t clientId)
{
	if (serverToClientMap.find(serverId) != serverToClientMap.end()) {
		return;
	}

	auto it = clientToServerMap.find(clientId);
	if (it != clientToServerMap.end() && it->second != serverId) {
		ambiguousServerIds.push_back(serverId);
		return;
	}

	serverToClientMap.emplace(serverId, clientId);
	clientToServerMap.emplace(clientId, serverId);
}

bool IdMapper::serverToClient(uint16_t serverId, uint16_t& clientId) const
{
	auto it = serverToClientMap.find(serverId);
	if (it == serverToClientMap.end()) {
		return false;
	}

	clientId = it->second;
	return true;
}

bool IdMapper::clientToServer(uint16_t clientId, uint16_t& serverId) const
{
	auto it = clientToServerMap.find(clientId);
	if (it == clientToServerMap.end()) {
		return false;
	}

	serverId = it->second;
	return true;
}

uint16_t IdMapper::requireClientId(uint16_t serverId) const
{
	uint16_t clientId;
	if (!serverToClient(serverId, clientId)) {
		throw UnmappedItemId(serverId, false);
	}
	return clientId;
}

uint16_t IdMapper::requireServerId(uint16_t clientId) const
{
	uint16_t serverId;
	if (!clientToServer(clientId, serverId)) {
		throw UnmappedItemId(clientId, true);
	}
	return serverId;
}
