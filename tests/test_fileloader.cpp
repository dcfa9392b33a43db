// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "fileloader.h"
#include "resourceguard.h"

#include <gtest/gtest.h>

namespace {

const OTB::Identifier testIdentifier = {{'T', 'E', 'S', 'T'}};

std::string bytes(std::initializer_list<int> values)
{
	std::string out;
	for (int value : values) {
		out.push_back(static_cast<char>(value));
	}
	return out;
}

} // namespace

// ==================================================================
// escape codec
// ==================================================================

TEST(EscapeCodecTest, EscapesEveryMarker)
{
	const std::string payload = bytes({0x01, 0xFD, 0xFE, 0xFF, 0x02});

	std::string wire;
	OTB::escapeBytes(payload.data(), payload.size(), wire);

	EXPECT_EQ(wire, bytes({0x01, 0xFD, 0xFD, 0xFD, 0xFE, 0xFD, 0xFF, 0x02}));
}

TEST(EscapeCodecTest, DecodeRestoresEveryByteValue)
{
	std::string payload;
	for (int i = 0; i < 256; ++i) {
		payload.push_back(static_cast<char>(i));
		payload.push_back(static_cast<char>(255 - i));
	}

	std::string wire;
	OTB::escapeBytes(payload.data(), payload.size(), wire);

	std::string decoded;
	size_t consumed = 0;
	ASSERT_TRUE(OTB::unescapeBytes(wire, decoded, &consumed));
	EXPECT_EQ(decoded, payload);
	EXPECT_EQ(consumed, wire.size());
}

TEST(EscapeCodecTest, DecodeStopsAtUnescapedMarker)
{
	std::string decoded;
	size_t consumed = 0;
	ASSERT_TRUE(OTB::unescapeBytes(bytes({0x10, 0x11, 0xFE, 0x12}), decoded, &consumed));
	EXPECT_EQ(decoded, bytes({0x10, 0x11}));
	EXPECT_EQ(consumed, 2u);
}

TEST(EscapeCodecTest, DanglingEscapeIsInvalid)
{
	std::string decoded;
	EXPECT_FALSE(OTB::unescapeBytes(bytes({0x10, 0xFD}), decoded));
}

// ==================================================================
// loader
// ==================================================================

TEST(LoaderTest, WalksNestedNodesInFileOrder)
{
	const std::string content = "TEST" + bytes({0xFE, 0x01, 0xAA, 0xFE, 0x02, 0xBB, 0xFD, 0xFF, 0xFF, 0xFE, 0x03,
	                                            0xFF, 0xFF});
	std::istringstream stream(content);

	OTB::Loader loader(stream, testIdentifier);
	EXPECT_EQ(loader.enterRoot(), 0x01);
	EXPECT_TRUE(loader.hadIdentifier());

	PropStream props;
	ASSERT_TRUE(loader.getProps(props));
	uint8_t value;
	ASSERT_TRUE(props.read<uint8_t>(value));
	EXPECT_EQ(value, 0xAA);
	EXPECT_FALSE(loader.getProps(props));

	uint8_t type;
	ASSERT_TRUE(loader.nextChild(type));
	EXPECT_EQ(type, 0x02);
	ASSERT_TRUE(loader.getProps(props));
	EXPECT_EQ(props.size(), 2u);
	ASSERT_TRUE(props.read<uint8_t>(value));
	EXPECT_EQ(value, 0xBB);
	ASSERT_TRUE(props.read<uint8_t>(value));
	EXPECT_EQ(value, 0xFF);
	EXPECT_FALSE(loader.nextChild(type));
	loader.leaveNode();

	ASSERT_TRUE(loader.nextChild(type));
	EXPECT_EQ(type, 0x03);
	loader.leaveNode();

	EXPECT_FALSE(loader.nextChild(type));
	loader.leaveNode();
	EXPECT_FALSE(loader.hasTrailingData());
	EXPECT_EQ(loader.getPeakDepth(), 2u);
}

TEST(LoaderTest, LeaveNodeSkipsUnvisitedSubtree)
{
	const std::string content = "TEST" + bytes({0xFE, 0x01, 0xFE, 0x02, 0x01, 0xFE, 0x04, 0xFD, 0xFE, 0xFF, 0xFF,
	                                            0xFE, 0x03, 0x07, 0xFF, 0xFF});
	std::istringstream stream(content);

	OTB::Loader loader(stream, testIdentifier);
	loader.enterRoot();

	uint8_t type;
	ASSERT_TRUE(loader.nextChild(type));
	EXPECT_EQ(type, 0x02);
	loader.leaveNode();

	ASSERT_TRUE(loader.nextChild(type));
	EXPECT_EQ(type, 0x03);

	PropStream props;
	ASSERT_TRUE(loader.getProps(props));
	uint8_t value;
	ASSERT_TRUE(props.read<uint8_t>(value));
	EXPECT_EQ(value, 0x07);
	loader.leaveNode();
	loader.leaveNode();
	EXPECT_EQ(loader.getPeakDepth(), 3u);
}

TEST(LoaderTest, AcceptsWildcardIdentifier)
{
	std::istringstream stream(bytes({0, 0, 0, 0, 0xFE, 0x05, 0xFF}));

	OTB::Loader loader(stream, testIdentifier);
	EXPECT_EQ(loader.enterRoot(), 0x05);
	EXPECT_TRUE(loader.hadIdentifier());
}

TEST(LoaderTest, AcceptsMissingIdentifier)
{
	std::istringstream stream(bytes({0xFE, 0x05, 0xFF}));

	OTB::Loader loader(stream, testIdentifier);
	EXPECT_EQ(loader.enterRoot(), 0x05);
	EXPECT_FALSE(loader.hadIdentifier());
}

TEST(LoaderTest, RejectsForeignIdentifier)
{
	std::istringstream stream("OTHR" + bytes({0xFE, 0x05, 0xFF}));

	OTB::Loader loader(stream, testIdentifier);
	EXPECT_THROW(loader.enterRoot(), OTB::InvalidOTBFormat);
}

TEST(LoaderTest, RejectsEmptyStream)
{
	std::istringstream stream("");

	OTB::Loader loader(stream, testIdentifier);
	EXPECT_THROW(loader.enterRoot(), OTB::InvalidOTBFormat);
}

TEST(LoaderTest, ReportsOffsetAndPathOfUnclosedNode)
{
	std::istringstream stream("TEST" + bytes({0xFE, 0x01, 0x00, 0xFE, 0x02, 0x01, 0x02}));

	OTB::Loader loader(stream, testIdentifier);
	loader.enterRoot();

	uint8_t type;
	ASSERT_TRUE(loader.nextChild(type));

	try {
		loader.leaveNode();
		FAIL() << "unclosed node accepted";
	} catch (const OTB::InvalidOTBFormat& err) {
		EXPECT_EQ(err.getOffset(), 11u);
		EXPECT_EQ(err.getNodePath(), "1/2");
	}
}

TEST(LoaderTest, RejectsDanglingEscape)
{
	std::istringstream stream("TEST" + bytes({0xFE, 0x01, 0x00, 0xFD}));

	OTB::Loader loader(stream, testIdentifier);
	loader.enterRoot();

	PropStream props;
	EXPECT_THROW(loader.getProps(props), OTB::InvalidOTBFormat);
}

TEST(LoaderTest, RejectsBytesBetweenChildren)
{
	std::istringstream stream("TEST" + bytes({0xFE, 0x01, 0xFE, 0x02, 0xFF, 0x33, 0xFF}));

	OTB::Loader loader(stream, testIdentifier);
	loader.enterRoot();

	uint8_t type;
	ASSERT_TRUE(loader.nextChild(type));
	loader.leaveNode();
	EXPECT_THROW(loader.nextChild(type), OTB::InvalidOTBFormat);
}

TEST(LoaderTest, DepthLimitIsEnforcedWhileSkipping)
{
	std::string content = "TEST";
	for (int i = 0; i < 10; ++i) {
		content += bytes({0xFE, 0x01});
	}
	content += std::string(10, static_cast<char>(0xFF));
	std::istringstream stream(content);

	OTB::LoaderLimits limits;
	limits.maxDepth = 5;

	OTB::Loader loader(stream, testIdentifier, limits);
	loader.enterRoot();
	EXPECT_THROW(loader.leaveNode(), ResourceLimitError);
}

TEST(LoaderTest, PayloadLimitIsEnforced)
{
	std::istringstream stream("TEST" + bytes({0xFE, 0x01}) + std::string(100, 'x') + bytes({0xFF}));

	OTB::LoaderLimits limits;
	limits.maxPayloadSize = 64;

	OTB::Loader loader(stream, testIdentifier, limits);
	loader.enterRoot();

	PropStream props;
	EXPECT_THROW(loader.getProps(props), ResourceLimitError);
}

TEST(LoaderTest, PeakPayloadTracksLargestDecodedNode)
{
	std::istringstream stream("TEST" + bytes({0xFE, 0x01, 0x01, 0xFE, 0x02}) + std::string(40, 'a') +
	                          bytes({0xFF, 0xFE, 0x02}) + std::string(10, 'b') + bytes({0xFF, 0xFF}));

	OTB::Loader loader(stream, testIdentifier);
	loader.enterRoot();

	PropStream props;
	loader.getProps(props);

	uint8_t type;
	while (loader.nextChild(type)) {
		ASSERT_TRUE(loader.getProps(props));
		loader.leaveNode();
	}
	loader.leaveNode();

	EXPECT_EQ(loader.getPeakPayloadSize(), 40u);
}

// ==================================================================
// node writer
// ==================================================================

TEST(NodeWriterTest, OutputIsReadBackByLoader)
{
	std::ostringstream out;
	OTB::NodeWriter writer(out);
	writer.writeIdentifier(testIdentifier);
	writer.startNode(0x01);

	PropWriteStream props;
	props.write<uint32_t>(0xFEFDFFFE);
	props.writeString("marker \xFF text");
	writer.writeProps(props);

	writer.startNode(0x02);
	writer.endNode();
	EXPECT_EQ(writer.getDepth(), 1u);
	writer.endNode();
	EXPECT_EQ(writer.getDepth(), 0u);

	std::istringstream in(out.str());
	OTB::Loader loader(in, testIdentifier);
	loader.enterRoot();

	PropStream readProps;
	ASSERT_TRUE(loader.getProps(readProps));

	uint32_t number;
	std::string text;
	ASSERT_TRUE(readProps.read<uint32_t>(number));
	ASSERT_TRUE(readProps.readString(text));
	EXPECT_EQ(number, 0xFEFDFFFEu);
	EXPECT_EQ(text, "marker \xFF text");

	uint8_t type;
	ASSERT_TRUE(loader.nextChild(type));
	EXPECT_EQ(type, 0x02);
	loader.leaveNode();
	loader.leaveNode();
}

// ==================================================================
// property streams
// ==================================================================

TEST(PropStreamTest, ReadsFailWithoutConsumingPastEnd)
{
	const char data[] = {0x01, 0x02, 0x03};

	PropStream stream;
	stream.init(data, sizeof(data));

	uint16_t value;
	ASSERT_TRUE(stream.read<uint16_t>(value));
	EXPECT_EQ(value, 0x0201);

	uint32_t tooLarge;
	EXPECT_FALSE(stream.read<uint32_t>(tooLarge));
	EXPECT_EQ(stream.size(), 1u);

	std::string rest;
	stream.readRemainder(rest);
	EXPECT_EQ(rest, std::string(1, 0x03));
	EXPECT_EQ(stream.size(), 0u);

	EXPECT_TRUE(stream.seek(1));
	EXPECT_EQ(stream.tell(), 1u);
	EXPECT_FALSE(stream.seek(4));
}

TEST(PropStreamTest, StringLengthIsChecked)
{
	PropWriteStream out;
	out.write<uint16_t>(10);
	out.writeBytes("abc");

	size_t size;
	const char* data = out.getStream(size);

	PropStream stream;
	stream.init(data, size);

	std::string str;
	EXPECT_FALSE(stream.readString(str));
}
