/*
 *	Unit tests for the legacy remote packet codec
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungPacket.hpp"
#include "samsungErrors.hpp"

#include <gtest/gtest.h>
#include <stdexcept>


TEST(Packet, SerializeStringEncodesPayload)
{
	EXPECT_EQ(std::string("\x04\x00" "UEM=", 6), samsungPacket::SerializeString("PC"));
	EXPECT_EQ(std::string("\x00\x00", 2), samsungPacket::SerializeString(""));
}


TEST(Packet, SerializeStringRaw)
{
	EXPECT_EQ(std::string("\x03\x00" "abc", 5), samsungPacket::SerializeString("abc", true));
}


TEST(Packet, SerializeStringRejectsLongPayload)
{
	EXPECT_NO_THROW(samsungPacket::SerializeString(std::string(255, 'x'), true));
	EXPECT_THROW(samsungPacket::SerializeString(std::string(256, 'x'), true), std::invalid_argument);
	// 192 bytes encode to 256 base64 characters
	EXPECT_THROW(samsungPacket::SerializeString(std::string(192, 'x')), std::invalid_argument);
}


TEST(Packet, BuildControl)
{
	const std::string expected(
		"\x00\x00\x00"			// prefix
		"\x11\x00"			// payload length
		"\x00\x00\x00"
		"\x0c\x00" "S0VZX1ZPTFVQ",	// base64 of KEY_VOLUP
		22);
	EXPECT_EQ(expected, samsungPacket::BuildControl("KEY_VOLUP"));
}


TEST(Packet, DecodeControlRecoversKey)
{
	const char *keys[] = { "KEY_VOLUP", "KEY_POWEROFF", "KEY_0", "KEY_MENU" };
	for (size_t i = 0; i < sizeof(keys) / sizeof(keys[0]); i++)
		EXPECT_EQ(std::string(keys[i]), samsungPacket::DecodeControl(samsungPacket::BuildControl(keys[i])));
}


TEST(Packet, DecodeControlRejectsGarbage)
{
	EXPECT_THROW(samsungPacket::DecodeControl(std::string("\x01\x02\x03\x04", 4)), Samsung::UnhandledResponse);
	EXPECT_THROW(samsungPacket::DecodeControl(std::string("\x00\x00\x00\x20\x00", 5)), Samsung::UnhandledResponse);
}


TEST(Packet, BuildHandshake)
{
	const std::string expected(
		"\x00\x00\x00"
		"\x1c\x00"
		"\x64\x00"
		"\x04\x00" "UEM="			// PC
		"\x00\x00"				// empty id
		"\x10\x00" "c2Ftc3VuZ2N0bA==",		// samsungctl
		33);
	EXPECT_EQ(expected, samsungPacket::BuildHandshake("PC", "", "samsungctl"));
}


TEST(Packet, ParseFrame)
{
	const std::string frame(
		"\x00" "\x00\x05" "iapp."
		"\x00\x04" "\x64\x00\x01\x00",
		14);

	std::string szDeviceName;
	std::string szResponse;
	size_t consumed;
	ASSERT_TRUE(samsungPacket::ParseFrame(frame, szDeviceName, szResponse, consumed));
	EXPECT_EQ("iapp.", szDeviceName);
	EXPECT_EQ(std::string("\x64\x00\x01\x00", 4), szResponse);
	EXPECT_EQ(frame.length(), consumed);
}


TEST(Packet, ParseFrameBigEndianLengths)
{
	std::string szName(0x0102, 'n');
	std::string frame("\x00\x01\x02", 3);
	frame.append(szName);
	frame.append("\x00\x02" "ok", 4);

	std::string szDeviceName;
	std::string szResponse;
	size_t consumed;
	ASSERT_TRUE(samsungPacket::ParseFrame(frame, szDeviceName, szResponse, consumed));
	EXPECT_EQ(szName, szDeviceName);
	EXPECT_EQ("ok", szResponse);
}


TEST(Packet, ParseFrameIncomplete)
{
	const std::string frame(
		"\x00" "\x00\x05" "iapp."
		"\x00\x04" "\x64\x00\x01\x00",
		14);

	std::string szDeviceName;
	std::string szResponse;
	size_t consumed = 99;
	for (size_t length = 0; length < frame.length(); length++)
	{
		EXPECT_FALSE(samsungPacket::ParseFrame(frame.substr(0, length), szDeviceName, szResponse, consumed));
		EXPECT_EQ(0u, consumed);
	}
}


TEST(Packet, ParseFrameLeavesTrailingData)
{
	std::string frames(
		"\x00" "\x00\x01" "a" "\x00\x01" "x"
		"\x00" "\x00\x01" "b" "\x00\x01" "y",
		14);

	std::string szDeviceName;
	std::string szResponse;
	size_t consumed;
	ASSERT_TRUE(samsungPacket::ParseFrame(frames, szDeviceName, szResponse, consumed));
	EXPECT_EQ("a", szDeviceName);
	EXPECT_EQ(7u, consumed);
	ASSERT_TRUE(samsungPacket::ParseFrame(frames.substr(consumed), szDeviceName, szResponse, consumed));
	EXPECT_EQ("b", szDeviceName);
	EXPECT_EQ("y", szResponse);
}


TEST(Packet, Classify)
{
	EXPECT_EQ(Samsung::Legacy::Response::GRANTED, samsungPacket::Classify(std::string("\x64\x00\x01\x00", 4)));
	EXPECT_EQ(Samsung::Legacy::Response::DENIED, samsungPacket::Classify(std::string("\x64\x00\x00\x00", 4)));
	EXPECT_EQ(Samsung::Legacy::Response::WAITING, samsungPacket::Classify(std::string("\x0a\x00\x02\x00\x00\x00", 6)));
	EXPECT_EQ(Samsung::Legacy::Response::CANCELLED, samsungPacket::Classify(std::string("\x65\x00", 2)));
	EXPECT_EQ(Samsung::Legacy::Response::ACCEPTED, samsungPacket::Classify(std::string("\x00\x00\x00\x00", 4)));
	EXPECT_EQ(Samsung::Legacy::Response::UNKNOWN, samsungPacket::Classify(std::string("\x64\x00\x02\x00", 4)));
	EXPECT_EQ(Samsung::Legacy::Response::UNKNOWN, samsungPacket::Classify(""));
}
