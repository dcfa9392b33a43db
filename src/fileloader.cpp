// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "fileloader.h"

#include "resourceguard.h"

namespace OTB {

namespace {

constexpr Identifier wildcard = {{'\0', '\0', '\0', '\0'}};
constexpr int END_OF_STREAM = std::char_traits<char>::eof();

} // namespace

void escapeBytes(const char* data, size_t size, std::string& out)
{
	out.reserve(out.size() + size);
	for (size_t i = 0; i < size; ++i) {
		const uint8_t byte = static_cast<uint8_t>(data[i]);
		if (isSpecialByte(byte)) {
			out.push_back(static_cast<char>(ESCAPE_CHAR));
		}
		out.push_back(data[i]);
	}
}

bool unescapeBytes(std::string_view wire, std::string& out, size_t* consumed)
{
	size_t i = 0;
	bool valid = true;
	while (i < wire.size()) {
		const uint8_t byte = static_cast<uint8_t>(wire[i]);
		if (byte == START || byte == END) {
			break;
		}

		if (byte == ESCAPE_CHAR) {
			if (i + 1 >= wire.size()) {
				valid = false;
				break;
			}

			out.push_back(wire[i + 1]);
			i += 2;
			continue;
		}

		out.push_back(wire[i]);
		++i;
	}

	if (consumed) {
		*consumed = i;
	}
	return valid;
}

InvalidOTBFormat::InvalidOTBFormat(const std::string& reason, uint64_t offset, const std::string& nodePath) :
    std::runtime_error(
        fmt::format("{:s} (offset {:d}, node {:s})", reason, offset, nodePath.empty() ? "none" : nodePath)),
    reason(reason),
    offset(offset),
    nodePath(nodePath)
{}

Loader::Loader(std::istream& stream, const Identifier& acceptedIdentifier, const LoaderLimits& limits) :
    buffer(stream.rdbuf()), identifier(acceptedIdentifier), limits(limits)
{}

int Loader::get()
{
	if (!buffer) {
		return END_OF_STREAM;
	}

	const int c = buffer->sbumpc();
	if (c != END_OF_STREAM) {
		++offset;
	}
	return c;
}

int Loader::peek()
{
	if (!buffer) {
		return END_OF_STREAM;
	}
	return buffer->sgetc();
}

void Loader::fail(const std::string& reason) const { throw InvalidOTBFormat(reason, offset, getNodePath()); }

std::string Loader::getNodePath() const
{
	std::string path;
	for (const Frame& frame : frames) {
		if (!path.empty()) {
			path.push_back('/');
		}

		const char* name = nodeNamer ? nodeNamer(frame.type) : nullptr;
		if (name) {
			path += name;
		} else {
			path += std::to_string(frame.type);
		}
	}
	return path;
}

void Loader::pushFrame(uint8_t type, uint64_t nodeOffset)
{
	if (frames.size() >= limits.maxDepth) {
		throw ResourceLimitError(
		    fmt::format("Node nesting deeper than {:d} levels at offset {:d}.", limits.maxDepth, nodeOffset));
	}

	frames.push_back({type, nodeOffset, false});
	peakDepth = std::max(peakDepth, frames.size());
}

uint8_t Loader::enterRoot()
{
	if (!frames.empty()) {
		fail("Root node is already open");
	}

	const int first = peek();
	if (first == END_OF_STREAM) {
		fail("Empty file");
	}

	if (first == START) {
		identifierPresent = false;
	} else {
		Identifier fileIdentifier;
		for (char& c : fileIdentifier) {
			const int byte = get();
			if (byte == END_OF_STREAM) {
				fail("Truncated file identifier");
			}
			c = static_cast<char>(byte);
		}

		if (fileIdentifier != identifier && fileIdentifier != wildcard) {
			fail("Invalid file identifier");
		}
	}

	const uint64_t nodeOffset = offset;
	if (get() != START) {
		fail("Invalid first byte, expected node start");
	}

	const int type = get();
	if (type == END_OF_STREAM) {
		fail("Truncated root node");
	}

	pushFrame(static_cast<uint8_t>(type), nodeOffset);
	return static_cast<uint8_t>(type);
}

bool Loader::getProps(PropStream& props)
{
	if (frames.empty()) {
		fail("No open node to read properties from");
	}

	Frame& frame = frames.back();
	if (frame.propsRead) {
		return false;
	}

	frame.propsRead = true;
	propBuffer.clear();

	while (true) {
		int c = peek();
		if (c == END_OF_STREAM) {
			fail("Unexpected end of file inside node payload");
		}

		if (c == START || c == END) {
			break;
		}

		get();
		if (c == ESCAPE_CHAR) {
			c = get();
			if (c == END_OF_STREAM) {
				fail("Escape byte at end of file");
			}
		}

		if (propBuffer.size() >= limits.maxPayloadSize) {
			throw ResourceLimitError(fmt::format("Node payload larger than {:d} bytes at offset {:d}.",
			                                     limits.maxPayloadSize, frame.offset));
		}
		propBuffer.push_back(static_cast<char>(c));
	}

	peakPayloadSize = std::max(peakPayloadSize, propBuffer.size());
	props.init(propBuffer.data(), propBuffer.size());
	return true;
}

void Loader::skipProps()
{
	while (true) {
		const int c = peek();
		if (c == END_OF_STREAM) {
			fail("Unexpected end of file inside node payload");
		}

		if (c == START || c == END) {
			return;
		}

		get();
		if (c == ESCAPE_CHAR && get() == END_OF_STREAM) {
			fail("Escape byte at end of file");
		}
	}
}

bool Loader::nextChild(uint8_t& type)
{
	if (frames.empty()) {
		fail("No open node to read children from");
	}

	Frame& frame = frames.back();
	if (!frame.propsRead) {
		skipProps();
		frame.propsRead = true;
	}

	const int c = peek();
	if (c == END_OF_STREAM) {
		fail("Unexpected end of file, node is not closed");
	}

	if (c == END) {
		return false;
	}

	if (c != START) {
		fail("Unexpected byte, expected node start or end");
	}

	const uint64_t nodeOffset = offset;
	get();

	const int nodeType = get();
	if (nodeType == END_OF_STREAM) {
		fail("Truncated node type");
	}

	pushFrame(static_cast<uint8_t>(nodeType), nodeOffset);
	type = static_cast<uint8_t>(nodeType);
	return true;
}

void Loader::leaveNode()
{
	if (frames.empty()) {
		fail("Unmatched node end");
	}

	Frame& frame = frames.back();
	if (!frame.propsRead) {
		skipProps();
		frame.propsRead = true;
	}

	// counted walk over the unvisited subtree
	size_t nested = 0;
	bool inPayload = false;
	while (true) {
		const int c = get();
		if (c == END_OF_STREAM) {
			fail("Unexpected end of file, node is not closed");
		}

		if (c == START) {
			if (get() == END_OF_STREAM) {
				fail("Truncated node type");
			}

			++nested;
			if (frames.size() + nested > limits.maxDepth) {
				throw ResourceLimitError(
				    fmt::format("Node nesting deeper than {:d} levels at offset {:d}.", limits.maxDepth, offset));
			}
			peakDepth = std::max(peakDepth, frames.size() + nested);
			inPayload = true;
		} else if (c == END) {
			if (nested == 0) {
				frames.pop_back();
				return;
			}

			--nested;
			inPayload = false;
		} else if (!inPayload) {
			fail("Unexpected byte, expected node start or end");
		} else if (c == ESCAPE_CHAR && get() == END_OF_STREAM) {
			fail("Escape byte at end of file");
		}
	}
}

bool Loader::hasTrailingData() { return peek() != END_OF_STREAM; }

void NodeWriter::writeIdentifier(const Identifier& identifier) { stream.write(identifier.data(), identifier.size()); }

void NodeWriter::startNode(uint8_t type)
{
	stream.put(static_cast<char>(START));
	stream.put(static_cast<char>(type));
	++depth;
}

void NodeWriter::endNode()
{
	stream.put(static_cast<char>(END));
	if (depth > 0) {
		--depth;
	}
}

void NodeWriter::writeProps(const PropWriteStream& props)
{
	size_t size;
	const char* data = props.getStream(size);
	writeProps(data, size);
}

void NodeWriter::writeProps(const char* data, size_t size)
{
	escaped.clear();
	escapeBytes(data, size, escaped);
	stream.write(escaped.data(), escaped.size());
}

} // namespace OTB
