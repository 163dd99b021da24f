/*
 *	Unit tests for the channel and source records
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungChannel.hpp"
#include "samsungErrors.hpp"

#include <gtest/gtest.h>


namespace {

const char *CHANNEL_BBC =
	"<Channel>"
	"<ChType>CDTV</ChType><MajorCh>1</MajorCh><MinorCh>65534</MinorCh>"
	"<PTC>BBC ONE</PTC><ProgNum>4165</ProgNum>"
	"</Channel>";

const char *SOURCE_HDMI =
	"<Source>"
	"<SourceType>HDMI1</SourceType><ID>57</ID><Editable>Yes</Editable>"
	"<EditNameType>Blu-ray</EditNameType><DeviceName>BD-J5500</DeviceName>"
	"<Connected>Yes</Connected><SupportView>Yes</SupportView>"
	"</Source>";

}; // namespace


TEST(Channel, FieldsFromRecord)
{
	Samsung::Channel channel(Samsung::XML::Parse(CHANNEL_BBC), nullptr);
	EXPECT_EQ(1, channel.GetMajor());
	EXPECT_EQ(65534, channel.GetMinor());
	EXPECT_EQ(std::make_pair(1, 65534), channel.GetNumber());
	EXPECT_EQ("BBC ONE", channel.GetName());

	std::string szValue;
	ASSERT_TRUE(channel.GetField("ProgNum", szValue));
	EXPECT_EQ("4165", szValue);
	ASSERT_TRUE(channel.GetField("ChType", szValue));
	EXPECT_EQ("CDTV", szValue);
	EXPECT_FALSE(channel.GetField("DispNo", szValue));
}


TEST(Channel, RecordWithoutNumberIsRejected)
{
	EXPECT_THROW(Samsung::Channel(Samsung::XML::Parse("<Channel><MajorCh>1</MajorCh></Channel>"), nullptr), Samsung::XMLError);
	EXPECT_THROW(Samsung::Channel(Samsung::XML::Parse("<Channel><PTC>x</PTC></Channel>"), nullptr), Samsung::XMLError);
	EXPECT_THROW(Samsung::Channel(Samsung::XML::Parse("<Channel><MajorCh>one</MajorCh><MinorCh>1</MinorCh></Channel>"), nullptr), Samsung::Error);
}


TEST(Channel, EqualityByNumber)
{
	Samsung::Channel first(Samsung::XML::Parse(CHANNEL_BBC), nullptr);
	Samsung::Channel renamed(Samsung::XML::Parse("<Channel><MajorCh>1</MajorCh><MinorCh>65534</MinorCh><PTC>BBC 1</PTC></Channel>"), nullptr);
	Samsung::Channel other(Samsung::XML::Parse("<Channel><MajorCh>2</MajorCh><MinorCh>65534</MinorCh></Channel>"), nullptr);

	EXPECT_TRUE(first == renamed);
	EXPECT_TRUE(first != other);
	EXPECT_TRUE(first == std::make_pair(1, 65534));
	EXPECT_FALSE(first == std::make_pair(65534, 1));
}


TEST(Source, FieldsFromRecord)
{
	Samsung::Source source(Samsung::XML::Parse(SOURCE_HDMI), nullptr);
	EXPECT_EQ(57, source.GetID());
	EXPECT_EQ("HDMI1", source.GetName());
	EXPECT_TRUE(source.IsEditable());
	EXPECT_EQ("Blu-ray", source.GetLabel());
	ASSERT_TRUE((bool)source.GetDeviceName());
	EXPECT_EQ("BD-J5500", *source.GetDeviceName());
	ASSERT_TRUE((bool)source.IsConnected());
	EXPECT_TRUE(*source.IsConnected());
	EXPECT_TRUE(source.IsViewable());
}


TEST(Source, LabelFallsBackToType)
{
	Samsung::Source unnamed(Samsung::XML::Parse(
		"<Source><SourceType>HDMI2</SourceType><ID>58</ID><Editable>Yes</Editable><EditNameType>NONE</EditNameType></Source>"), nullptr);
	EXPECT_EQ("HDMI2", unnamed.GetLabel());
	EXPECT_FALSE((bool)unnamed.GetDeviceName());
	EXPECT_FALSE((bool)unnamed.IsConnected());
	EXPECT_FALSE(unnamed.IsViewable());

	// only editable sources carry a user assigned name
	Samsung::Source fixed(Samsung::XML::Parse(
		"<Source><SourceType>TV</SourceType><ID>0</ID><Editable>No</Editable><EditNameType>Aerial</EditNameType></Source>"), nullptr);
	EXPECT_EQ("TV", fixed.GetLabel());
	EXPECT_FALSE(fixed.SetLabel("Cable"));
}


TEST(Source, RecordWithoutIDIsRejected)
{
	EXPECT_THROW(Samsung::Source(Samsung::XML::Parse("<Source><SourceType>TV</SourceType></Source>"), nullptr), Samsung::XMLError);
	EXPECT_THROW(Samsung::Source(Samsung::XML::Parse("<Source><ID>1</ID></Source>"), nullptr), Samsung::XMLError);
}


TEST(Source, DisconnectedSourceIsNotActivated)
{
	Samsung::Source source(Samsung::XML::Parse(
		"<Source><SourceType>AV</SourceType><ID>3</ID><Connected>No</Connected></Source>"), nullptr);
	EXPECT_FALSE(source.Activate());
}


TEST(Source, EqualityByID)
{
	Samsung::Source first(Samsung::XML::Parse(SOURCE_HDMI), nullptr);
	Samsung::Source same(Samsung::XML::Parse("<Source><SourceType>HDMI</SourceType><ID>57</ID></Source>"), nullptr);
	Samsung::Source other(Samsung::XML::Parse("<Source><SourceType>HDMI1</SourceType><ID>58</ID></Source>"), nullptr);

	EXPECT_TRUE(first == same);
	EXPECT_TRUE(first != other);
	EXPECT_TRUE(first == 57);
}
