/*
 *	Client interface for local Samsung TV access
 *
 *	Channel and input source records
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
#include "samsungTV.hpp"
#include "samsungErrors.hpp"
#include "samsungLog.hpp"

// terrestrial
#define ANTENNA_MODE_AIR "1"


Samsung::Channel::Channel(const XML::Node &node, samsungTV *tv) :
	m_node(node),
	m_tv(tv)
{
	if (!(node.Has("MajorCh") && node.Has("MinorCh")))
		throw Samsung::XMLError("channel record without MajorCh/MinorCh");
	m_major = samsungTV::ParseInt(node.FindText("MajorCh"));
	m_minor = samsungTV::ParseInt(node.FindText("MinorCh"));
}


std::string Samsung::Channel::GetName() const
{
	return m_node.FindText("PTC");
}


bool Samsung::Channel::GetField(const std::string &szName, std::string &szValue) const
{
	const XML::Node *field = m_node.Find(szName);
	if (field == nullptr)
		return false;
	szValue = field->text;
	return true;
}


bool Samsung::Channel::IsActive() const
{
	boost::optional<Channel> current = m_tv->GetChannel();
	return current && (*current == *this);
}


boost::optional<bool> Samsung::Channel::IsRecording() const
{
	Samsung::ActionHandle getRecordChannel = m_tv->Resolve("MainTVAgent2", "GetRecordChannel");
	if (!getRecordChannel)
		return boost::none;

	Samsung::UPnP::Results results = getRecordChannel();
	if ((results.size() < 2) || results[1].empty())
		return false;

	Channel recording(Samsung::XML::Parse(Samsung::XML::Unescape(results[1])), m_tv);
	return recording == *this;
}


bool Samsung::Channel::Activate() const
{
	Samsung::ActionHandle getChannelListURL = m_tv->Resolve("MainTVAgent2", "GetChannelListURL");
	Samsung::ActionHandle setMainTVChannel = m_tv->Resolve("MainTVAgent2", "SetMainTVChannel");
	if (!(getChannelListURL && setMainTVChannel))
		return false;

	// Result, ChannelListVersion, SupportChannelList, ChannelListURL, ChannelListType, SatelliteID
	Samsung::UPnP::Results listinfo = getChannelListURL();
	Samsung::UPnP::Arguments args;
	args.push_back(ANTENNA_MODE_AIR);
	args.push_back((listinfo.size() > 4) ? listinfo[4] : "");
	args.push_back((listinfo.size() > 5) ? listinfo[5] : "");
	args.push_back(Samsung::XML::Serialize(m_node));

	Samsung::Log::Info("switching to channel " + std::to_string(m_major) + "." + std::to_string(m_minor));
	setMainTVChannel(args);
	return true;
}


bool Samsung::Channel::operator==(const Channel &other) const
{
	return (m_major == other.m_major) && (m_minor == other.m_minor);
}


bool Samsung::Channel::operator==(const std::pair<int, int> &number) const
{
	return (m_major == number.first) && (m_minor == number.second);
}


/* ---------------------------------------------------------------------------------------------------------------- */


Samsung::Source::Source(const XML::Node &node, samsungTV *tv) :
	m_node(node),
	m_tv(tv)
{
	if (!(node.Has("ID") && node.Has("SourceType")))
		throw Samsung::XMLError("source record without ID/SourceType");
	m_id = samsungTV::ParseInt(node.FindText("ID"));
	m_name = node.FindText("SourceType");
	m_editable = (node.FindText("Editable") == "Yes");
}


std::string Samsung::Source::GetLabel() const
{
	if (m_editable)
	{
		const XML::Node *label = m_node.Find("EditNameType");
		if ((label != nullptr) && (label->text != "NONE") && (!label->text.empty()))
			return label->text;
	}
	return m_name;
}


boost::optional<std::string> Samsung::Source::GetDeviceName() const
{
	const XML::Node *deviceName = m_node.Find("DeviceName");
	if (deviceName == nullptr)
		return boost::none;
	return deviceName->text;
}


boost::optional<bool> Samsung::Source::IsConnected() const
{
	std::string szConnected = m_node.FindText("Connected");
	if (szConnected == "Yes")
		return true;
	if (szConnected == "No")
		return false;
	return boost::none;
}


bool Samsung::Source::IsViewable() const
{
	return m_node.FindText("SupportView") == "Yes";
}


bool Samsung::Source::IsActive() const
{
	boost::optional<int> active = m_tv->GetActiveSourceID();
	return active && (*active == m_id);
}


bool Samsung::Source::Activate() const
{
	boost::optional<bool> connected = IsConnected();
	if (!(connected && *connected))
	{
		Samsung::Log::Info("source " + GetLabel() + " is not connected");
		return false;
	}

	Samsung::ActionHandle setMainTVSource = m_tv->Resolve("MainTVAgent2", "SetMainTVSource");
	if (!setMainTVSource)
		return false;

	Samsung::UPnP::Arguments args;
	args.push_back(m_name);
	args.push_back(std::to_string(m_id));
	args.push_back(std::to_string(m_id));
	Samsung::Log::Info("switching to source " + GetLabel());
	setMainTVSource(args);
	return true;
}


bool Samsung::Source::SetLabel(const std::string &szLabel) const
{
	if (!m_editable)
		return false;

	Samsung::ActionHandle editSourceName = m_tv->Resolve("MainTVAgent2", "EditSourceName");
	if (!editSourceName)
		return false;

	Samsung::UPnP::Arguments args;
	args.push_back(m_name);
	args.push_back(szLabel);
	editSourceName(args);
	return true;
}
