/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

#include "radio/icy/MetadataParser.hpp"


using radio::icy::Metadata;
using radio::icy::MetadataParser;


TEST(MetadataParserTest, Parse1)
{
	MetadataParser parser;

	auto result = parser.parse("StreamTitle='Artist - Title';StreamUrl='http://example.com';");

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value(), (Metadata{{"StreamTitle", "Artist - Title"}, {"StreamUrl", "http://example.com"}}));
}

TEST(MetadataParserTest, Parse2)
{
	MetadataParser parser;

	// zero padding up to 16 byte boundary
	auto result = parser.parse(std::string{"StreamTitle='x';", 16} + std::string(16, '\0'));

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value(), (Metadata{{"StreamTitle", "x"}}));
}

TEST(MetadataParserTest, Parse3)
{
	MetadataParser parser;

	// quotes inside a value
	auto result = parser.parse("StreamTitle='Rock 'n' Roll';StreamUrl='';");

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value().at("StreamTitle"), "Rock 'n' Roll");
	EXPECT_EQ(result.value().at("StreamUrl"), "");
}

TEST(MetadataParserTest, Parse4)
{
	MetadataParser parser;

	// last pair without a terminating semicolon
	auto result = parser.parse("StreamTitle='It's over'");

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value().at("StreamTitle"), "It's over");
}

TEST(MetadataParserTest, Parse5)
{
	MetadataParser parser;

	EXPECT_FALSE(parser.parse("").has_value());
	EXPECT_FALSE(parser.parse(std::string(32, '\0')).has_value());
	EXPECT_FALSE(parser.parse("no pairs here").has_value());
	EXPECT_FALSE(parser.parse("='value';").has_value());
	EXPECT_FALSE(parser.parse("StreamTitle='unterminated").has_value());
}

TEST(MetadataParserTest, Parse6)
{
	MetadataParser parser;

	auto result = parser.parse("StreamTitle=plain;");

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value().at("StreamTitle"), "plain");
}
