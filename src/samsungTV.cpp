/*
 *	Client interface for local Samsung TV access
 *
 *	TV capability facade
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungTV.hpp"
#include "samsungHTTP.hpp"
#include "samsungErrors.hpp"
#include "samsungLog.hpp"
#include <stdexcept>
#include <cstdlib>
#include <cctype>
#include <cerrno>
#include <climits>

#define INSTANCE_ID "0"
#define MASTER_CHANNEL "Master"


namespace {

Json::Value ToJson(const boost::optional<int> &value)
{
	if (!value)
		return Json::Value();
	return Json::Value(*value);
}


Json::Value ToJson(const boost::optional<bool> &value)
{
	if (!value)
		return Json::Value();
	return Json::Value(*value);
}


Json::Value ToJson(const Samsung::OptionalString &value)
{
	if (!value)
		return Json::Value();
	return Json::Value(*value);
}


std::string JsonToString(const Json::Value &value)
{
	if (value.isString())
		return value.asString();
	if (value.isBool())
		return value.asBool() ? "true" : "false";
	if (value.isNumeric())
		return std::to_string(value.asInt64());
	return "";
}

}; // namespace


samsungTV::samsungTV(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery) :
	m_config(config),
	m_discovery(discovery),
	m_tvOptions(Json::objectValue),
	m_infoPort(SAMSUNG_INFO_PORT)
{
	if (!m_discovery)
		m_discovery = std::make_shared<Samsung::UPnP::DescriptionLoader>();
	m_attributes["ip_address"] = m_config.host;
	RegisterProperties();
}


samsungTV::~samsungTV()
{
}


/* private */ void samsungTV::RegisterProperties()
{
	RegisterProperty("power", [this]() { return Json::Value(GetPower()); });
	RegisterProperty("volume",
		[this]() { return ToJson(GetVolume()); },
		[this](const Json::Value &value) { SetVolume(value.asInt()); });
	RegisterProperty("mute",
		[this]() { return ToJson(GetMute()); },
		[this](const Json::Value &value) { SetMute(value.asBool()); });
	RegisterProperty("brightness",
		[this]() { return ToJson(GetBrightness()); },
		[this](const Json::Value &value) { SetBrightness(value.asInt()); });
	RegisterProperty("contrast",
		[this]() { return ToJson(GetContrast()); },
		[this](const Json::Value &value) { SetContrast(value.asInt()); });
	RegisterProperty("sharpness",
		[this]() { return ToJson(GetSharpness()); },
		[this](const Json::Value &value) { SetSharpness(value.asInt()); });
	RegisterProperty("color_temperature",
		[this]() { return ToJson(GetColorTemperature()); },
		[this](const Json::Value &value) { SetColorTemperature(value.asInt()); });
	RegisterProperty("aspect_ratio",
		[this]() { return ToJson(GetAspectRatio()); },
		[this](const Json::Value &value) { SetAspectRatio(value.asString()); });
	RegisterProperty("play_mode",
		[this]() { return ToJson(GetPlayMode()); },
		[this](const Json::Value &value) { SetPlayMode(value.asString()); });
	RegisterProperty("channel",
		[this]() -> Json::Value
		{
			boost::optional<Samsung::Channel> channel = GetChannel();
			if (!channel)
				return Json::Value();
			Json::Value number(Json::arrayValue);
			number.append(channel->GetMajor());
			number.append(channel->GetMinor());
			return number;
		},
		[this](const Json::Value &value)
		{
			if (value.isString())
			{
				SetChannel(value.asString());
				return;
			}
			if ((!value.isArray()) || (value.size() != 2))
				throw std::invalid_argument("channel must be given as [major, minor] or \"major.minor\"");
			SetChannel(value[0].asInt(), value[1].asInt());
		});
	RegisterProperty("source",
		[this]() -> Json::Value
		{
			boost::optional<Samsung::Source> source = GetSource();
			if (!source)
				return Json::Value();
			return Json::Value(source->GetLabel());
		},
		[this](const Json::Value &value)
		{
			if (value.isIntegral())
				SetSource(value.asInt());
			else
				SetSource(value.asString());
		});
	RegisterProperty("model", [this]() { return ToJson(GetModel()); });
	RegisterProperty("device_id", [this]() { return ToJson(GetDeviceID()); });
	RegisterProperty("year", [this]() { return ToJson(GetYear()); });
	RegisterProperty("region", [this]() { return ToJson(GetRegion()); });
	RegisterProperty("tuner_count", [this]() { return ToJson(GetTunerCount()); });
	RegisterProperty("panel_technology", [this]() { return ToJson(GetPanelTechnology()); });
	RegisterProperty("panel_type", [this]() { return ToJson(GetPanelType()); });
	RegisterProperty("size", [this]() { return ToJson(GetSize()); });
	RegisterProperty("tv_options", [this]() { return GetTVOptions(); });
}


void samsungTV::RegisterProperty(const std::string &szName, const Getter &getter, const Setter &setter)
{
	Property property;
	property.getter = getter;
	property.setter = setter;
	m_properties[szName].push_back(property);
}


void samsungTV::Connect()
{
	if (!GetPower())
	{
		Samsung::Log::Info("TV at " + m_config.host + " is powered off, no capabilities available");
		m_capabilities.Clear();
		return;
	}
	m_capabilities.Rebuild(m_discovery->Describe(m_config.host, m_config.upnp_locations));
}


void samsungTV::Disconnect()
{
	m_capabilities.Clear();
	std::lock_guard<std::mutex> lock(m_cacheMutex);
	m_dtvInformation = boost::none;
	m_tvOptions = Json::Value(Json::objectValue);
}


Samsung::ActionHandle samsungTV::Resolve(const std::string &szService, const std::string &szAction) const
{
	return m_capabilities.Resolve(szService, szAction);
}


Samsung::Attribute samsungTV::GetAttribute(const std::string &szName) const
{
	Samsung::Attribute attribute;
	{
		std::lock_guard<std::mutex> lock(m_attributeMutex);
		std::map<std::string, Json::Value>::const_iterator it = m_attributes.find(szName);
		if (it != m_attributes.end())
		{
			attribute.kind = Samsung::Attribute::VALUE;
			attribute.value = it->second;
			return attribute;
		}
	}

	attribute.device = m_capabilities.GetDevice(szName);
	if (attribute.device)
	{
		attribute.kind = Samsung::Attribute::DEVICE;
		return attribute;
	}

	attribute.service = m_capabilities.GetService(szName);
	if (attribute.service)
	{
		attribute.kind = Samsung::Attribute::SERVICE;
		return attribute;
	}

	std::map<std::string, std::vector<Property> >::const_iterator it = m_properties.find(szName);
	if (it != m_properties.end())
	{
		for (std::vector<Property>::const_reverse_iterator property = it->second.rbegin(); property != it->second.rend(); ++property)
		{
			if (property->getter)
			{
				attribute.kind = Samsung::Attribute::VALUE;
				attribute.value = property->getter();
				return attribute;
			}
		}
	}
	return attribute;
}


void samsungTV::SetAttribute(const std::string &szName, const Json::Value &value)
{
	std::map<std::string, std::vector<Property> >::const_iterator it = m_properties.find(szName);
	if (it != m_properties.end())
	{
		for (std::vector<Property>::const_reverse_iterator property = it->second.rbegin(); property != it->second.rend(); ++property)
		{
			if (property->setter)
			{
				property->setter(value);
				return;
			}
		}
	}

	std::lock_guard<std::mutex> lock(m_attributeMutex);
	m_attributes[szName] = value;
}


bool samsungTV::GetPower()
{
	return true;
}


/* private */ Samsung::OptionalString samsungTV::At(const Samsung::UPnP::Results &results, const size_t index)
{
	if (index >= results.size())
		return boost::none;
	return results[index];
}


bool samsungTV::Invoke(const std::string &szService, const std::string &szAction, const Samsung::UPnP::Arguments &args, Samsung::UPnP::Results &results) const
{
	Samsung::ActionHandle action = m_capabilities.Resolve(szService, szAction);
	if (!action)
	{
		Samsung::Log::Debug(szService + "." + szAction + " is not available");
		return false;
	}
	results = action(args);
	return true;
}


Samsung::OptionalString samsungTV::InvokeValue(const std::string &szService, const std::string &szAction, const Samsung::UPnP::Arguments &args, const size_t index) const
{
	Samsung::UPnP::Results results;
	if (!Invoke(szService, szAction, args, results))
		return boost::none;
	return At(results, index);
}


int samsungTV::ParseInt(const std::string &szValue)
{
	char *end = nullptr;
	errno = 0;
	long value = strtol(szValue.c_str(), &end, 10);
	if (szValue.empty() || (end == nullptr) || (*end != '\0'))
		throw Samsung::Error("expected a number, got '" + szValue + "'");
	if ((errno == ERANGE) || (value < INT_MIN) || (value > INT_MAX))
		throw Samsung::Error("number out of range: '" + szValue + "'");
	return (int)value;
}


bool samsungTV::ParseBool(const std::string &szValue)
{
	std::string szLower = szValue;
	for (size_t i = 0; i < szLower.length(); i++)
		szLower[i] = (char)tolower(szLower[i]);
	return (szLower == "1") || (szLower == "true") || (szLower == "yes") || (szLower == "enable") || (szLower == "on");
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* volume and picture                                                                                               */
/* ---------------------------------------------------------------------------------------------------------------- */


boost::optional<int> samsungTV::GetVolume() const
{
	Samsung::UPnP::Results results;
	if (Invoke("MainTVAgent2", "GetVolume", {}, results))
	{
		Samsung::OptionalString volume = At(results, 1);
		if (!volume)
			return boost::none;
		return ParseInt(*volume);
	}
	return GetChannelVolume(MASTER_CHANNEL);
}


bool samsungTV::SetVolume(const int volume)
{
	Samsung::UPnP::Results results;
	if (Invoke("MainTVAgent2", "SetVolume", {std::to_string(volume)}, results))
		return true;
	return SetChannelVolume(MASTER_CHANNEL, volume);
}


boost::optional<bool> samsungTV::GetMute() const
{
	Samsung::UPnP::Results results;
	if (Invoke("MainTVAgent2", "GetMuteStatus", {}, results))
	{
		Samsung::OptionalString status = At(results, 1);
		if (!status)
			return boost::none;
		return ParseBool(*status);
	}
	return GetChannelMute(MASTER_CHANNEL);
}


bool samsungTV::SetMute(const bool mute)
{
	Samsung::UPnP::Results results;
	if (Invoke("MainTVAgent2", "SetMute", {mute ? "Enable" : "Disable"}, results))
		return true;
	return SetChannelMute(MASTER_CHANNEL, mute);
}


boost::optional<int> samsungTV::GetChannelVolume(const std::string &szChannel) const
{
	Samsung::OptionalString volume = InvokeValue("RenderingControl", "GetVolume", {INSTANCE_ID, szChannel}, 0);
	if (!volume)
		return boost::none;
	return ParseInt(*volume);
}


bool samsungTV::SetChannelVolume(const std::string &szChannel, const int volume)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SetVolume", {INSTANCE_ID, szChannel, std::to_string(volume)}, results);
}


boost::optional<bool> samsungTV::GetChannelMute(const std::string &szChannel) const
{
	Samsung::OptionalString mute = InvokeValue("RenderingControl", "GetMute", {INSTANCE_ID, szChannel}, 0);
	if (!mute)
		return boost::none;
	return ParseBool(*mute);
}


bool samsungTV::SetChannelMute(const std::string &szChannel, const bool mute)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SetMute", {INSTANCE_ID, szChannel, mute ? "1" : "0"}, results);
}


boost::optional<int> samsungTV::GetBrightness() const
{
	Samsung::OptionalString brightness = InvokeValue("RenderingControl", "GetBrightness", {INSTANCE_ID}, 0);
	if (!brightness)
		return boost::none;
	return ParseInt(*brightness);
}


bool samsungTV::SetBrightness(const int brightness)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SetBrightness", {INSTANCE_ID, std::to_string(brightness)}, results);
}


boost::optional<int> samsungTV::GetContrast() const
{
	Samsung::OptionalString contrast = InvokeValue("RenderingControl", "GetContrast", {INSTANCE_ID}, 0);
	if (!contrast)
		return boost::none;
	return ParseInt(*contrast);
}


bool samsungTV::SetContrast(const int contrast)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SetContrast", {INSTANCE_ID, std::to_string(contrast)}, results);
}


boost::optional<int> samsungTV::GetSharpness() const
{
	Samsung::OptionalString sharpness = InvokeValue("RenderingControl", "GetSharpness", {INSTANCE_ID}, 0);
	if (!sharpness)
		return boost::none;
	return ParseInt(*sharpness);
}


bool samsungTV::SetSharpness(const int sharpness)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SetSharpness", {INSTANCE_ID, std::to_string(sharpness)}, results);
}


boost::optional<int> samsungTV::GetColorTemperature() const
{
	Samsung::OptionalString temperature = InvokeValue("RenderingControl", "GetColorTemperature", {INSTANCE_ID}, 0);
	if (!temperature)
		return boost::none;
	return ParseInt(*temperature);
}


bool samsungTV::SetColorTemperature(const int temperature)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SetColorTemperature", {INSTANCE_ID, std::to_string(temperature)}, results);
}


Samsung::OptionalString samsungTV::GetAspectRatio() const
{
	return InvokeValue("RenderingControl", "X_GetAspectRatio", {INSTANCE_ID}, 0);
}


bool samsungTV::SetAspectRatio(const std::string &szAspectRatio)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "X_SetAspectRatio", {INSTANCE_ID, szAspectRatio}, results);
}


Samsung::OptionalString samsungTV::ListPresets() const
{
	return InvokeValue("RenderingControl", "ListPresets", {INSTANCE_ID}, 0);
}


bool samsungTV::SelectPreset(const std::string &szPreset)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "SelectPreset", {INSTANCE_ID, szPreset}, results);
}


Samsung::StreamSelection samsungTV::GetAudioSelection() const
{
	Samsung::StreamSelection selection;
	Samsung::UPnP::Results results;
	if (Invoke("RenderingControl", "X_GetAudioSelection", {INSTANCE_ID}, results))
	{
		selection.pid = At(results, 0);
		selection.encoding = At(results, 1);
	}
	return selection;
}


bool samsungTV::SetAudioSelection(const std::string &szEncoding, const std::string &szPID)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "X_UpdateAudioSelection", {INSTANCE_ID, szPID, szEncoding}, results);
}


Samsung::StreamSelection samsungTV::GetVideoSelection() const
{
	Samsung::StreamSelection selection;
	Samsung::UPnP::Results results;
	if (Invoke("RenderingControl", "X_GetVideoSelection", {INSTANCE_ID}, results))
	{
		selection.pid = At(results, 0);
		selection.encoding = At(results, 1);
	}
	return selection;
}


bool samsungTV::SetVideoSelection(const std::string &szEncoding, const std::string &szPID)
{
	Samsung::UPnP::Results results;
	return Invoke("RenderingControl", "X_UpdateVideoSelection", {INSTANCE_ID, szPID, szEncoding}, results);
}


Samsung::CaptionState samsungTV::GetCaptionState() const
{
	Samsung::CaptionState state;
	Samsung::UPnP::Results results;
	if (Invoke("RenderingControl", "X_GetCaptionState", {INSTANCE_ID}, results))
	{
		state.captions = At(results, 0);
		state.enabled_captions = At(results, 1);
	}
	return state;
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* media playback                                                                                                   */
/* ---------------------------------------------------------------------------------------------------------------- */


bool samsungTV::Play(const std::string &szSpeed)
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "Play", {INSTANCE_ID, szSpeed}, results);
}


bool samsungTV::Pause()
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "Pause", {INSTANCE_ID}, results);
}


bool samsungTV::Stop()
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "Stop", {INSTANCE_ID}, results);
}


bool samsungTV::Next()
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "Next", {INSTANCE_ID}, results);
}


bool samsungTV::Previous()
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "Previous", {INSTANCE_ID}, results);
}


bool samsungTV::Seek(const std::string &szTarget, const std::string &szUnit)
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "Seek", {INSTANCE_ID, szUnit, szTarget}, results);
}


Samsung::OptionalString samsungTV::GetPlayMode() const
{
	return GetTransportSettings().play_mode;
}


bool samsungTV::SetPlayMode(const std::string &szPlayMode)
{
	Samsung::UPnP::Results results;
	return Invoke("AVTransport", "SetPlayMode", {INSTANCE_ID, szPlayMode}, results);
}


Samsung::TransportInfo samsungTV::GetTransportInfo() const
{
	Samsung::TransportInfo info;
	Samsung::UPnP::Results results;
	if (Invoke("AVTransport", "GetTransportInfo", {INSTANCE_ID}, results))
	{
		info.state = At(results, 0);
		info.status = At(results, 1);
		info.speed = At(results, 2);
	}
	return info;
}


Samsung::TransportSettings samsungTV::GetTransportSettings() const
{
	Samsung::TransportSettings settings;
	Samsung::UPnP::Results results;
	if (Invoke("AVTransport", "GetTransportSettings", {INSTANCE_ID}, results))
	{
		settings.play_mode = At(results, 0);
		settings.rec_quality_mode = At(results, 1);
	}
	return settings;
}


Samsung::PositionInfo samsungTV::GetPositionInfo() const
{
	Samsung::PositionInfo info;
	Samsung::UPnP::Results results;
	if (Invoke("AVTransport", "GetPositionInfo", {INSTANCE_ID}, results))
	{
		info.track = At(results, 0);
		info.track_duration = At(results, 1);
		info.track_metadata = At(results, 2);
		info.track_uri = At(results, 3);
		info.relative_time = At(results, 4);
		info.absolute_time = At(results, 5);
		info.relative_count = At(results, 6);
		info.absolute_count = At(results, 7);
	}
	return info;
}


Samsung::MediaInfo samsungTV::GetMediaInfo() const
{
	Samsung::MediaInfo info;
	Samsung::UPnP::Results results;
	if (Invoke("AVTransport", "GetMediaInfo", {INSTANCE_ID}, results))
	{
		info.num_tracks = At(results, 0);
		info.media_duration = At(results, 1);
		info.current_uri = At(results, 2);
		info.current_uri_metadata = At(results, 3);
		info.next_uri = At(results, 4);
		info.next_uri_metadata = At(results, 5);
		info.play_medium = At(results, 6);
		info.record_medium = At(results, 7);
		info.write_status = At(results, 8);
	}
	return info;
}


Samsung::DeviceCapabilities samsungTV::GetDeviceCapabilities() const
{
	Samsung::DeviceCapabilities capabilities;
	Samsung::UPnP::Results results;
	if (Invoke("AVTransport", "GetDeviceCapabilities", {INSTANCE_ID}, results))
	{
		capabilities.play_media = At(results, 0);
		capabilities.rec_media = At(results, 1);
		capabilities.rec_quality_modes = At(results, 2);
	}
	return capabilities;
}


Samsung::StoppedReason samsungTV::GetStoppedReason() const
{
	Samsung::StoppedReason reason;
	Samsung::UPnP::Results results;
	if (Invoke("AVTransport", "X_GetStoppedReason", {INSTANCE_ID}, results))
	{
		reason.reason = At(results, 0);
		reason.reason_data = At(results, 1);
	}
	return reason;
}


Samsung::OptionalString samsungTV::GetCurrentTransportActions() const
{
	return InvokeValue("AVTransport", "GetCurrentTransportActions", {INSTANCE_ID}, 0);
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* connection manager                                                                                               */
/* ---------------------------------------------------------------------------------------------------------------- */


Samsung::OptionalString samsungTV::GetCurrentConnectionIDs() const
{
	return InvokeValue("ConnectionManager", "GetCurrentConnectionIDs", {}, 0);
}


Samsung::ConnectionInfo samsungTV::GetCurrentConnectionInfo(const std::string &szConnectionID) const
{
	Samsung::ConnectionInfo info;
	Samsung::UPnP::Results results;
	if (Invoke("ConnectionManager", "GetCurrentConnectionInfo", {szConnectionID}, results))
	{
		info.rcs_id = At(results, 0);
		info.av_transport_id = At(results, 1);
		info.protocol_info = At(results, 2);
		info.peer_connection_manager = At(results, 3);
		info.peer_connection_id = At(results, 4);
		info.direction = At(results, 5);
		info.status = At(results, 6);
	}
	return info;
}


Samsung::ProtocolInfo samsungTV::GetProtocolInfo() const
{
	Samsung::ProtocolInfo info;
	Samsung::UPnP::Results results;
	if (Invoke("ConnectionManager", "GetProtocolInfo", {}, results))
	{
		info.source = At(results, 0);
		info.sink = At(results, 1);
	}
	return info;
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* TV agent                                                                                                         */
/* ---------------------------------------------------------------------------------------------------------------- */


Samsung::OptionalString samsungTV::GetBannerInformation() const
{
	return InvokeValue("MainTVAgent2", "GetBannerInformation", {}, 1);
}


Samsung::OptionalString samsungTV::GetCurrentTime() const
{
	return InvokeValue("MainTVAgent2", "GetCurrentTime", {}, 1);
}


Samsung::OptionalString samsungTV::GetNetworkInformation() const
{
	return InvokeValue("MainTVAgent2", "GetNetworkInformation", {}, 1);
}


Samsung::WatchingInformation samsungTV::GetWatchingInformation() const
{
	Samsung::WatchingInformation info;
	Samsung::UPnP::Results results;
	if (Invoke("MainTVAgent2", "GetWatchingInformation", {}, results))
	{
		info.tv_mode = At(results, 1);
		info.information = At(results, 2);
	}
	return info;
}


Samsung::OptionalString samsungTV::RunBrowser(const std::string &szURL)
{
	return InvokeValue("MainTVAgent2", "RunBrowser", {szURL}, 0);
}


Samsung::OptionalString samsungTV::RunApp(const std::string &szApplicationID)
{
	return InvokeValue("MainTVAgent2", "RunApp", {szApplicationID}, 0);
}


bool samsungTV::SendKeyCode(const std::string &szKeyCode, const std::string &szKeyDescription)
{
	Samsung::UPnP::Results results;
	bool sent = Invoke("TestRCRService", "SendKeyCode", {szKeyCode, szKeyDescription}, results);
	if (Invoke("MultiScreenService", "SendKeyCode", {szKeyCode, szKeyDescription}, results))
		sent = true;
	return sent;
}


Samsung::OptionalString samsungTV::StartInstantRecording(const std::string &szChannel)
{
	return InvokeValue("MainTVAgent2", "StartInstantRecording", {szChannel}, 1);
}


Samsung::OptionalString samsungTV::StopRecord(const std::string &szChannel)
{
	return InvokeValue("MainTVAgent2", "StopRecord", {szChannel}, 0);
}


Samsung::OptionalString samsungTV::CheckPIN(const std::string &szPIN)
{
	return InvokeValue("MainTVAgent2", "CheckPIN", {szPIN}, 0);
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* channels and sources                                                                                             */
/* ---------------------------------------------------------------------------------------------------------------- */


boost::optional<std::vector<Samsung::Channel> > samsungTV::GetChannels()
{
	Samsung::OptionalString list = InvokeValue("MainTVAgent2", "GetChannelListURL", {}, 2);
	if (!list)
		return boost::none;

	std::vector<Samsung::Channel> channels;
	if (list->empty())
		return channels;

	Samsung::XML::Node root = Samsung::XML::Parse(Samsung::XML::Unescape(*list));
	for (size_t i = 0; i < root.children.size(); i++)
		channels.push_back(Samsung::Channel(root.children[i], this));
	return channels;
}


boost::optional<Samsung::Channel> samsungTV::GetChannel()
{
	Samsung::OptionalString current = InvokeValue("MainTVAgent2", "GetCurrentMainTVChannel", {}, 1);
	if ((!current) || current->empty())
		return boost::none;
	return Samsung::Channel(Samsung::XML::Parse(Samsung::XML::Unescape(*current)), this);
}


bool samsungTV::SetChannel(const Samsung::Channel &channel)
{
	return SetChannel(channel.GetMajor(), channel.GetMinor());
}


bool samsungTV::SetChannel(const int major, const int minor)
{
	boost::optional<std::vector<Samsung::Channel> > channels = GetChannels();
	if (!channels)
		return false;

	std::pair<int, int> number(major, minor);
	for (size_t i = 0; i < channels->size(); i++)
	{
		if ((*channels)[i] == number)
			return (*channels)[i].Activate();
	}
	throw std::invalid_argument("channel not found (" + std::to_string(major) + "." + std::to_string(minor) + ")");
}


bool samsungTV::SetChannel(const std::string &szChannel)
{
	// "4.1" or "4"
	size_t dot = szChannel.find('.');
	int major;
	int minor = 0;
	try
	{
		major = ParseInt(szChannel.substr(0, dot));
		if (dot != std::string::npos)
			minor = ParseInt(szChannel.substr(dot + 1));
	}
	catch (const Samsung::Error &)
	{
		throw std::invalid_argument("invalid channel number '" + szChannel + "'");
	}
	return SetChannel(major, minor);
}


boost::optional<std::vector<Samsung::Source> > samsungTV::GetSources()
{
	Samsung::OptionalString list = InvokeValue("MainTVAgent2", "GetSourceList", {}, 1);
	if (!list)
		return boost::none;

	std::vector<Samsung::Source> sources;
	if (list->empty())
		return sources;

	Samsung::XML::Node root = Samsung::XML::Parse(Samsung::XML::Unescape(*list));
	for (size_t i = 0; i < root.children.size(); i++)
	{
		if (root.children[i].name == "Source")
			sources.push_back(Samsung::Source(root.children[i], this));
	}
	return sources;
}


boost::optional<Samsung::Source> samsungTV::GetSource()
{
	Samsung::OptionalString current = InvokeValue("MainTVAgent2", "GetCurrentExternalSource", {}, 2);
	if ((!current) || current->empty())
		return boost::none;

	int id = ParseInt(*current);
	boost::optional<std::vector<Samsung::Source> > sources = GetSources();
	if (!sources)
		return boost::none;
	for (size_t i = 0; i < sources->size(); i++)
	{
		if ((*sources)[i] == id)
			return (*sources)[i];
	}
	return boost::none;
}


boost::optional<int> samsungTV::GetActiveSourceID() const
{
	Samsung::OptionalString list = InvokeValue("MainTVAgent2", "GetSourceList", {}, 1);
	if ((!list) || list->empty())
		return boost::none;

	Samsung::XML::Node root = Samsung::XML::Parse(Samsung::XML::Unescape(*list));
	if (!root.Has("ID"))
		return boost::none;
	return ParseInt(root.FindText("ID"));
}


bool samsungTV::SetSource(const int id)
{
	boost::optional<std::vector<Samsung::Source> > sources = GetSources();
	if (!sources)
		return false;

	for (size_t i = 0; i < sources->size(); i++)
	{
		if ((*sources)[i] == id)
			return (*sources)[i].Activate();
	}
	throw std::invalid_argument("source id not found (" + std::to_string(id) + ")");
}


bool samsungTV::SetSource(const std::string &szName)
{
	boost::optional<std::vector<Samsung::Source> > sources = GetSources();
	if (!sources)
		return false;

	for (size_t i = 0; i < sources->size(); i++)
	{
		const Samsung::Source &source = (*sources)[i];
		boost::optional<std::string> deviceName = source.GetDeviceName();
		if ((source.GetName() == szName) || (source.GetLabel() == szName) || (deviceName && (*deviceName == szName)))
			return source.Activate();
	}
	throw std::invalid_argument("source name not found (" + szName + ")");
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* identification                                                                                                   */
/* ---------------------------------------------------------------------------------------------------------------- */


boost::optional<Samsung::XML::Node> samsungTV::GetDTVInformation()
{
	{
		std::lock_guard<std::mutex> lock(m_cacheMutex);
		if (m_dtvInformation)
			return m_dtvInformation;
	}

	Samsung::OptionalString data = InvokeValue("MainTVAgent2", "GetDTVInformation", {}, 1);
	if ((!data) || data->empty())
		return boost::none;

	Samsung::XML::Node information = Samsung::XML::Parse(Samsung::XML::Unescape(*data));
	std::lock_guard<std::mutex> lock(m_cacheMutex);
	m_dtvInformation = information;
	return m_dtvInformation;
}


boost::optional<int> samsungTV::GetYear()
{
	boost::optional<Samsung::XML::Node> information = GetDTVInformation();
	if (information)
	{
		if (!information->Has("SupportTVVersion"))
			return boost::none;
		return ParseInt(information->FindText("SupportTVVersion"));
	}

	// ProductCap starts with the model year, e.g. "Y2011,..."
	std::shared_ptr<Samsung::UPnP::Service> receiver = m_capabilities.GetService("RemoteControlReceiver");
	std::string szProductCap;
	if (receiver && receiver->GetAttribute("ProductCap", szProductCap))
	{
		std::string szYear = szProductCap.substr(0, szProductCap.find(','));
		size_t digits = szYear.find_first_of("0123456789");
		if (digits != std::string::npos)
			return ParseInt(szYear.substr(digits));
	}
	return boost::none;
}


Samsung::OptionalString samsungTV::GetRegion()
{
	boost::optional<Samsung::XML::Node> information = GetDTVInformation();
	if ((!information) || (!information->Has("TargetLocation")))
		return boost::none;

	std::string szLocation = information->FindText("TargetLocation");
	const std::string szPrefix = "TARGET_LOCATION_";
	if (szLocation.compare(0, szPrefix.length(), szPrefix) == 0)
		szLocation.erase(0, szPrefix.length());
	return szLocation;
}


boost::optional<int> samsungTV::GetTunerCount()
{
	boost::optional<Samsung::XML::Node> information = GetDTVInformation();
	if ((!information) || (!information->Has("TunerCount")))
		return boost::none;
	return ParseInt(information->FindText("TunerCount"));
}


boost::optional<bool> samsungTV::GetDTVSupport()
{
	boost::optional<Samsung::XML::Node> information = GetDTVInformation();
	if ((!information) || (!information->Has("SupportDTV")))
		return boost::none;
	return information->FindText("SupportDTV") == "Yes";
}


boost::optional<bool> samsungTV::GetPVRSupport()
{
	boost::optional<Samsung::XML::Node> information = GetDTVInformation();
	if ((!information) || (!information->Has("SupportPVR")))
		return boost::none;
	return information->FindText("SupportPVR") == "Yes";
}


Samsung::OptionalString samsungTV::GetModel() const
{
	std::shared_ptr<Samsung::UPnP::Service> transport = m_capabilities.GetService("AVTransport");
	std::string szModel;
	if ((!transport) || (!transport->GetAttribute("modelName", szModel)))
		return boost::none;
	return szModel;
}


Samsung::OptionalString samsungTV::GetPanelTechnology() const
{
	Samsung::OptionalString model = GetModel();
	if ((!model) || model->empty())
		return boost::none;

	switch ((*model)[0])
	{
		case 'Q':
			return std::string("QLED");
		case 'U':
			return std::string("LED");
		case 'P':
			return std::string("Plasma");
		case 'L':
			return std::string("LCD");
		case 'H':
			return std::string("DLP");
		case 'K':
			return std::string("OLED");
	}
	return std::string("Unknown");
}


Samsung::OptionalString samsungTV::GetPanelType()
{
	Samsung::OptionalString model = GetModel();
	if ((!model) || (model->length() < 6))
		return boost::none;

	const std::string &szModel = *model;
	if ((szModel[0] == 'Q') && (szModel[4] == 'Q'))
		return std::string("UHD");
	if (isdigit((unsigned char)szModel[5]))
		return std::string("FullHD");

	switch (szModel[5])
	{
		case 'S':
		{
			boost::optional<int> year = GetYear();
			return std::string((year && (*year == 2012)) ? "Slim" : "SUHD");
		}
		case 'U':
			return std::string("UHD");
		case 'P':
			return std::string("Plasma");
		case 'H':
			return std::string("Hybrid");
	}
	return boost::none;
}


boost::optional<int> samsungTV::GetSize() const
{
	Samsung::OptionalString model = GetModel();
	if ((!model) || (model->length() < 4))
		return boost::none;

	// UE40ES6100 -> 40
	std::string szSize = model->substr(2, 2);
	if (!(isdigit((unsigned char)szSize[0]) && isdigit((unsigned char)szSize[1])))
		return boost::none;
	return ParseInt(szSize);
}


Samsung::OptionalString samsungTV::GetDeviceID() const
{
	std::string szDeviceID;
	std::shared_ptr<Samsung::UPnP::Service> agent = m_capabilities.GetService("MainTVAgent2");
	if (agent && agent->GetAttribute("deviceID", szDeviceID))
		return szDeviceID;

	std::vector<std::string> services = m_capabilities.GetServiceNames();
	for (size_t i = 0; i < services.size(); i++)
	{
		std::shared_ptr<Samsung::UPnP::Service> service = m_capabilities.GetService(services[i]);
		if (service && (service->GetAttribute("deviceId", szDeviceID) || service->GetAttribute("deviceID", szDeviceID)))
			return szDeviceID;
	}
	return boost::none;
}


/* ---------------------------------------------------------------------------------------------------------------- */
/* device info endpoint                                                                                             */
/* ---------------------------------------------------------------------------------------------------------------- */


Json::Value samsungTV::GetTVOptions()
{
	{
		std::lock_guard<std::mutex> lock(m_cacheMutex);
		if (!m_tvOptions.empty())
			return m_tvOptions;
	}

	Samsung::HTTP::Response response;
	if ((!Samsung::HTTP::Get(GetInfoUrl(), SAMSUNG_INFO_TIMEOUT_MSECS, response)) || (response.status != 200))
		return Json::Value(Json::objectValue);

	Json::Value jResponse;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!jReader->parse(response.body.c_str(), response.body.c_str() + response.body.size(), &jResponse, &szErrors))
	{
		Samsung::Log::Warning("device info from " + m_config.host + " is not valid JSON: " + szErrors);
		return Json::Value(Json::objectValue);
	}
	if ((!jResponse.isObject()) || (!jResponse["device"].isObject()))
		return Json::Value(Json::objectValue);

	Json::Value jDevice = jResponse["device"];
	// isSupport is a JSON document inside a string
	if (jDevice["isSupport"].isString())
	{
		Json::Value jSupport;
		std::string szSupport = jDevice["isSupport"].asString();
		if (jReader->parse(szSupport.c_str(), szSupport.c_str() + szSupport.size(), &jSupport, &szErrors))
			jDevice["isSupport"] = jSupport;
		else
			Samsung::Log::Warning("ignoring malformed isSupport field: " + szErrors);
	}

	std::lock_guard<std::mutex> lock(m_cacheMutex);
	m_tvOptions = jDevice;
	return m_tvOptions;
}


Json::Value samsungTV::GetIsSupport()
{
	Json::Value jOptions = GetTVOptions();
	if (!jOptions["isSupport"].isObject())
		return Json::Value(Json::objectValue);
	return jOptions["isSupport"];
}


Samsung::HTTP::Url samsungTV::GetInfoUrl() const
{
	Samsung::HTTP::Url url;
	url.host = m_config.host;
	url.port = m_infoPort;
	url.target = SAMSUNG_INFO_PATH;
	return url;
}


/* private */ std::string samsungTV::GetTVOption(const std::string &szName)
{
	Json::Value jOptions = GetTVOptions();
	if (!jOptions.isMember(szName))
		return "Unknown";
	return JsonToString(jOptions[szName]);
}


std::string samsungTV::GetOperatingSystem()
{
	return GetTVOption("OS");
}


std::string samsungTV::GetFirmwareVersion()
{
	return GetTVOption("firmwareVersion");
}


std::string samsungTV::GetNetworkType()
{
	return GetTVOption("networkType");
}


std::string samsungTV::GetResolution()
{
	return GetTVOption("resolution");
}


std::string samsungTV::GetTokenAuthSupport()
{
	return GetTVOption("TokenAuthSupport");
}


std::string samsungTV::GetWifiMac()
{
	return GetTVOption("wifiMac");
}


std::string samsungTV::GetVoiceSupport()
{
	return GetTVOption("VoiceSupport");
}


std::string samsungTV::GetFrameTVSupport()
{
	return GetTVOption("FrameTVSupport");
}


std::string samsungTV::GetGamePadSupport()
{
	return GetTVOption("GamePadSupport");
}


bool samsungTV::IsAppsListAvailable()
{
	return !GetTVOptions().empty();
}


bool samsungTV::HasSupportFlag(const std::string &szFlag)
{
	Json::Value jSupport = GetIsSupport();
	if (!jSupport.isMember(szFlag))
		return false;
	if (jSupport[szFlag].isBool())
		return jSupport[szFlag].asBool();
	return ParseBool(JsonToString(jSupport[szFlag]));
}
