// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <istream>
#include <iterator>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class PropStream;
class PropWriteStream;

namespace OTB {

using Identifier = std::array<char, 4>;

enum SPECIAL_BYTES : uint8_t
{
	ESCAPE_CHAR = 0xFD,
	START = 0xFE,
	END = 0xFF,
};

// encodes logical payload bytes into wire bytes, escaping every marker value
void escapeBytes(const char* data, size_t size, std::string& out);
// decodes a payload written by escapeBytes; stops at the first unescaped marker
// and returns false if the input ends in a dangling escape byte
bool unescapeBytes(std::string_view wire, std::string& out, size_t* consumed = nullptr);

inline bool isSpecialByte(uint8_t byte) { return byte == ESCAPE_CHAR || byte == START || byte == END; }

class InvalidOTBFormat final : public std::runtime_error
{
public:
	InvalidOTBFormat(const std::string& reason, uint64_t offset, const std::string& nodePath);

	const std::string& getReason() const { return reason; }
	uint64_t getOffset() const { return offset; }
	const std::string& getNodePath() const { return nodePath; }

private:
	std::string reason;
	uint64_t offset;
	std::string nodePath;
};

struct LoaderLimits
{
	size_t maxPayloadSize = 16 * 1024 * 1024;
	size_t maxDepth = 512;
};

using NodeNamer = const char* (*)(uint8_t type);

/**
 * Streaming cursor over an OTB node tree.
 *
 * Nodes are visited in file order and never materialized: the caller enters the
 * root, reads the payload of the current node, iterates its children with
 * nextChild() and closes every entered node with leaveNode(). Unvisited
 * payloads and subtrees are skipped with a loop, so native stack usage is
 * constant and memory is bounded by the largest single payload.
 */
class Loader
{
public:
	Loader(std::istream& stream, const Identifier& acceptedIdentifier, const LoaderLimits& limits = {});

	// non-copyable
	Loader(const Loader&) = delete;
	Loader& operator=(const Loader&) = delete;

	// reads the identifier and opens the root node, returns its type
	uint8_t enterRoot();

	/// <summary>
	/// Decodes the payload of the current node into propStream.
	/// The stream stays valid until the next call to getProps.
	/// </summary>
	/// <returns>False if the payload of the current node was already consumed.</returns>
	bool getProps(PropStream& props);

	// opens the next child of the current node, false once the node has no more children
	bool nextChild(uint8_t& type);

	// closes the current node, skipping whatever remains unread inside it
	void leaveNode();

	bool hasTrailingData();
	bool hadIdentifier() const { return identifierPresent; }

	size_t getDepth() const { return frames.size(); }
	uint64_t tell() const { return offset; }
	std::string getNodePath() const;

	size_t getPeakPayloadSize() const { return peakPayloadSize; }
	size_t getPeakDepth() const { return peakDepth; }

	void setNodeNamer(NodeNamer namer) { nodeNamer = namer; }

	[[noreturn]] void fail(const std::string& reason) const;

private:
	struct Frame
	{
		uint8_t type;
		uint64_t offset;
		bool propsRead;
	};

	int get();
	int peek();
	void pushFrame(uint8_t type, uint64_t nodeOffset);
	void skipProps();

	std::streambuf* buffer;
	Identifier identifier;
	LoaderLimits limits;
	NodeNamer nodeNamer = nullptr;

	std::vector<Frame> frames;
	std::vector<char> propBuffer;

	uint64_t offset = 0;
	size_t peakPayloadSize = 0;
	size_t peakDepth = 0;
	bool identifierPresent = true;
};

/**
 * Writes an escaped OTB node tree onto an output stream.
 */
class NodeWriter
{
public:
	explicit NodeWriter(std::ostream& stream) : stream(stream) {}

	// non-copyable
	NodeWriter(const NodeWriter&) = delete;
	NodeWriter& operator=(const NodeWriter&) = delete;

	void writeIdentifier(const Identifier& identifier);
	void startNode(uint8_t type);
	void endNode();

	void writeProps(const PropWriteStream& props);
	void writeProps(const char* data, size_t size);

	size_t getDepth() const { return depth; }
	bool good() const { return stream.good(); }

private:
	std::ostream& stream;
	std::string escaped;
	size_t depth = 0;
};

} // namespace OTB

class PropStream
{
public:
	void init(const char* a, size_t size)
	{
		begin = a;
		p = a;
		end = a + size;
	}

	size_t size() const { return end - p; }
	size_t tell() const { return p - begin; }
	const char* data() const { return p; }

	bool seek(size_t pos)
	{
		if (pos > static_cast<size_t>(end - begin)) {
			return false;
		}

		p = begin + pos;
		return true;
	}

	template <typename T>
	bool read(T& ret)
	{
		if (size() < sizeof(T)) {
			return false;
		}

		memcpy(&ret, p, sizeof(T));
		p += sizeof(T);
		return true;
	}

	bool readString(std::string& ret)
	{
		uint16_t strLen;
		if (!read<uint16_t>(strLen)) {
			return false;
		}

		return readBytes(ret, strLen);
	}

	bool readLongString(std::string& ret)
	{
		uint32_t strLen;
		if (!read<uint32_t>(strLen)) {
			return false;
		}

		return readBytes(ret, strLen);
	}

	bool readBytes(std::string& ret, size_t n)
	{
		if (size() < n) {
			return false;
		}

		ret.assign(p, n);
		p += n;
		return true;
	}

	// takes everything that is left
	void readRemainder(std::string& ret)
	{
		ret.assign(p, size());
		p = end;
	}

	bool skip(size_t n)
	{
		if (size() < n) {
			return false;
		}

		p += n;
		return true;
	}

private:
	const char* begin = nullptr;
	const char* p = nullptr;
	const char* end = nullptr;
};

class PropWriteStream
{
public:
	PropWriteStream() = default;

	// non-copyable
	PropWriteStream(const PropWriteStream&) = delete;
	PropWriteStream& operator=(const PropWriteStream&) = delete;

	const char* getStream(size_t& size) const
	{
		size = buffer.size();
		return buffer.data();
	}

	size_t size() const { return buffer.size(); }
	void clear() { buffer.clear(); }

	template <typename T>
	void write(T add)
	{
		char* addr = reinterpret_cast<char*>(&add);
		std::copy(addr, addr + sizeof(T), std::back_inserter(buffer));
	}

	void writeString(const std::string& str)
	{
		size_t strLength = str.size();
		if (strLength > std::numeric_limits<uint16_t>::max()) {
			write<uint16_t>(0);
			return;
		}

		write(static_cast<uint16_t>(strLength));
		std::copy(str.begin(), str.end(), std::back_inserter(buffer));
	}

	void writeLongString(const std::string& str)
	{
		write(static_cast<uint32_t>(str.size()));
		std::copy(str.begin(), str.end(), std::back_inserter(buffer));
	}

	void writeBytes(const std::string& bytes) { std::copy(bytes.begin(), bytes.end(), std::back_inserter(buffer)); }

private:
	std::vector<char> buffer;
};
