// Copyright 2023 The Forgotten Server Authors and Alejandro Mujica for many specific source code changes, All rights
// reserved. Use of this source code is governed by the GPL-2.0 License that can be found in the LICENSE file.

#include "otpch.h"

#include "mapdetection.h"
#include "testutils.h"

#include <gtest/gtest.h>

using namespace otmapio::test;

namespace {

MapFileKind_t detect(const std::string& content)
{
	std::istringstream stream(content);
	return detectMapFile(stream);
}

} // namespace

TEST(MapDetectionTest, RecognizesOTBM)
{
	EXPECT_EQ(detect(std::string("OTBM\xFE\x00", 6)), MAP_FILE_OTBM);
	EXPECT_EQ(detect(std::string("\0\0\0\0\xFE\x00", 6)), MAP_FILE_OTBM);
	EXPECT_EQ(detect(std::string("\xFE\x00\x02\x00", 4)), MAP_FILE_OTBM_NO_IDENTIFIER);

	EXPECT_TRUE(isOTBMFileKind(MAP_FILE_OTBM));
	EXPECT_TRUE(isOTBMFileKind(MAP_FILE_OTBM_NO_IDENTIFIER));
	EXPECT_FALSE(isOTBMFileKind(MAP_FILE_OTMM));
}

TEST(MapDetectionTest, RecognizesOtherFormats)
{
	EXPECT_EQ(detect("OTMM\x01"), MAP_FILE_OTMM);
	EXPECT_EQ(detect("<?xml version=\"1.0\"?><map/>"), MAP_FILE_XML);
	EXPECT_EQ(detect("\n  {\"map\": 1}"), MAP_FILE_JSON);
	EXPECT_EQ(detect(""), MAP_FILE_EMPTY);
	EXPECT_EQ(detect("OT"), MAP_FILE_UNKNOWN);
	EXPECT_EQ(detect("PK\x03\x04"), MAP_FILE_UNKNOWN);
}

TEST(MapDetectionTest, StreamPositionIsRestored)
{
	std::istringstream stream("OTBM rest of the file");
	stream.seekg(0);

	EXPECT_EQ(detectMapFile(stream), MAP_FILE_OTBM);
	EXPECT_EQ(stream.tellg(), std::streampos(0));

	char first;
	ASSERT_TRUE(stream.get(first).good());
	EXPECT_EQ(first, 'O');
}

TEST(MapDetectionTest, DetectsFiles)
{
	TemporaryDirectory dir;
	EXPECT_EQ(detectMapFile(dir.write("map.otbm", "OTBM\xFE")), MAP_FILE_OTBM);
	EXPECT_EQ(detectMapFile(dir.write("map.xml", "<map/>")), MAP_FILE_XML);
	EXPECT_EQ(detectMapFile(dir.file("missing.otbm")), MAP_FILE_UNKNOWN);
}

TEST(MapDetectionTest, KindNames)
{
	EXPECT_STREQ(getMapFileKindName(MAP_FILE_OTBM), "OTBM");
	EXPECT_STREQ(getMapFileKindName(MAP_FILE_JSON), "JSON");
	EXPECT_STREQ(getMapFileKindName(MAP_FILE_EMPTY), "empty file");
}
