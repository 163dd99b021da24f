/*
 *	Client interface for local Samsung TV access
 *
 *	Channel and input source records
 *
 *	Both are built from the XML fragments that the TV returns for its
 *	channel and source lists. They compare by natural key, the channel
 *	number (major, minor) and the source ID respectively, so a record from
 *	one listing matches the same channel or source in any later listing.
 *	The TV pointer is not owned and must outlive the record.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungChannel
#define _samsungChannel

#include "samsungXML.hpp"
#include <boost/optional.hpp>
#include <string>
#include <utility>

class samsungTV;


namespace Samsung {

class Channel
{
public:
	// throws Samsung::XMLError if the node lacks MajorCh or MinorCh
	Channel(const XML::Node &node, samsungTV *tv);

	std::pair<int, int> GetNumber() const { return std::make_pair(m_major, m_minor); }
	int GetMajor() const { return m_major; }
	int GetMinor() const { return m_minor; }
	std::string GetName() const;

	// any other field of the channel record (ChType, DispNo, ProgNum, ...)
	bool GetField(const std::string &szName, std::string &szValue) const;
	const XML::Node &GetNode() const { return m_node; }

	bool IsActive() const;
	boost::optional<bool> IsRecording() const;

	// tune the TV to this channel, false if the TV offers no way to do so
	bool Activate() const;

	bool operator==(const Channel &other) const;
	bool operator!=(const Channel &other) const { return !(*this == other); }
	bool operator==(const std::pair<int, int> &number) const;

private:
	XML::Node m_node;
	int m_major;
	int m_minor;
	samsungTV *m_tv;
};


class Source
{
public:
	// throws Samsung::XMLError if the node lacks ID or SourceType
	Source(const XML::Node &node, samsungTV *tv);

	int GetID() const { return m_id; }
	const std::string &GetName() const { return m_name; }
	bool IsEditable() const { return m_editable; }

	// user assigned name if there is one, else the source type
	std::string GetLabel() const;
	boost::optional<std::string> GetDeviceName() const;
	boost::optional<bool> IsConnected() const;
	bool IsViewable() const;
	const XML::Node &GetNode() const { return m_node; }

	bool IsActive() const;
	// switch the TV to this source, only done when the source is connected
	bool Activate() const;
	bool SetLabel(const std::string &szLabel) const;

	bool operator==(const Source &other) const { return m_id == other.m_id; }
	bool operator!=(const Source &other) const { return m_id != other.m_id; }
	bool operator==(const int id) const { return m_id == id; }

private:
	XML::Node m_node;
	int m_id;
	std::string m_name;
	bool m_editable;
	samsungTV *m_tv;
};

}; // namespace Samsung

#endif // _samsungChannel
