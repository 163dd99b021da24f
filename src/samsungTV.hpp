/*
 *	Client interface for local Samsung TV access
 *
 *	This is the TV capability facade, the base class of every remote.
 *
 *	Which UPnP services a TV offers differs per model and year. Every
 *	operation below resolves the service and action it needs from the
 *	capability directory and returns an empty value (boost::none, or a
 *	record with all fields set to boost::none) when the TV does not offer
 *	it. Faults of a service that is present, such as SOAP errors or
 *	malformed XML, are raised.
 *
 *	Attribute style access:
 *	 - GetAttribute(name)
 *		Resolves `name` in this order:
 *		1. values stored on this instance
 *		2. discovered child devices
 *		3. discovered services
 *		4. computed properties, those registered by the most derived
 *		   class first
 *	 - SetAttribute(name, value)
 *		Uses the most derived registered setter, stores the value on the
 *		instance if there is none
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungTV
#define _samsungTV

// device info endpoint of 2016+ models
#define SAMSUNG_INFO_PORT 8001
#define SAMSUNG_INFO_PATH "/api/v2/"
#define SAMSUNG_INFO_TIMEOUT_MSECS 2000

#include "samsungConfig.hpp"
#include "samsungCapabilities.hpp"
#include "samsungChannel.hpp"
#include "samsungUPnP.hpp"
#include "samsungXML.hpp"
#include "samsungHTTP.hpp"
#include <json/json.h>
#include <boost/optional.hpp>
#include <functional>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>


namespace Samsung {

typedef boost::optional<std::string> OptionalString;

struct Attribute
{
	enum Kind {
		NONE,
		VALUE,
		DEVICE,
		SERVICE
	};

	Kind kind = NONE;
	Json::Value value;
	std::shared_ptr<UPnP::Device> device;
	std::shared_ptr<UPnP::Service> service;

	explicit operator bool() const { return kind != NONE; }
};

struct TransportInfo
{
	OptionalString state;
	OptionalString status;
	OptionalString speed;
};

struct TransportSettings
{
	OptionalString play_mode;
	OptionalString rec_quality_mode;
};

struct PositionInfo
{
	OptionalString track;
	OptionalString track_duration;
	OptionalString track_metadata;
	OptionalString track_uri;
	OptionalString relative_time;
	OptionalString absolute_time;
	OptionalString relative_count;
	OptionalString absolute_count;
};

struct MediaInfo
{
	OptionalString num_tracks;
	OptionalString media_duration;
	OptionalString current_uri;
	OptionalString current_uri_metadata;
	OptionalString next_uri;
	OptionalString next_uri_metadata;
	OptionalString play_medium;
	OptionalString record_medium;
	OptionalString write_status;
};

struct DeviceCapabilities
{
	OptionalString play_media;
	OptionalString rec_media;
	OptionalString rec_quality_modes;
};

struct StoppedReason
{
	OptionalString reason;
	OptionalString reason_data;
};

struct ConnectionInfo
{
	OptionalString rcs_id;
	OptionalString av_transport_id;
	OptionalString protocol_info;
	OptionalString peer_connection_manager;
	OptionalString peer_connection_id;
	OptionalString direction;
	OptionalString status;
};

struct ProtocolInfo
{
	OptionalString source;
	OptionalString sink;
};

// audio or video stream selection
struct StreamSelection
{
	OptionalString pid;
	OptionalString encoding;
};

struct CaptionState
{
	OptionalString captions;
	OptionalString enabled_captions;
};

struct WatchingInformation
{
	OptionalString tv_mode;
	OptionalString information;
};

}; // namespace Samsung


class samsungTV
{
public:
	typedef std::function<Json::Value()> Getter;
	typedef std::function<void(const Json::Value&)> Setter;

	samsungTV(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery = nullptr);
	virtual ~samsungTV();

	// retrieve the UPnP descriptions and rebuild the capability directory
	void Connect();
	// drop all discovered capabilities
	void Disconnect();

	Samsung::Config &GetConfig() { return m_config; }
	const samsungCapabilities &GetCapabilities() const { return m_capabilities; }
	Samsung::ActionHandle Resolve(const std::string &szService, const std::string &szAction) const;

	Samsung::Attribute GetAttribute(const std::string &szName) const;
	void SetAttribute(const std::string &szName, const Json::Value &value);

	virtual bool GetPower();

	// volume and picture
	boost::optional<int> GetVolume() const;
	bool SetVolume(const int volume);
	boost::optional<bool> GetMute() const;
	bool SetMute(const bool mute);
	boost::optional<int> GetChannelVolume(const std::string &szChannel) const;
	bool SetChannelVolume(const std::string &szChannel, const int volume);
	boost::optional<bool> GetChannelMute(const std::string &szChannel) const;
	bool SetChannelMute(const std::string &szChannel, const bool mute);
	boost::optional<int> GetBrightness() const;
	bool SetBrightness(const int brightness);
	boost::optional<int> GetContrast() const;
	bool SetContrast(const int contrast);
	boost::optional<int> GetSharpness() const;
	bool SetSharpness(const int sharpness);
	boost::optional<int> GetColorTemperature() const;
	bool SetColorTemperature(const int temperature);
	Samsung::OptionalString GetAspectRatio() const;
	bool SetAspectRatio(const std::string &szAspectRatio = "Default");
	Samsung::OptionalString ListPresets() const;
	bool SelectPreset(const std::string &szPreset);
	Samsung::StreamSelection GetAudioSelection() const;
	bool SetAudioSelection(const std::string &szEncoding, const std::string &szPID = "0");
	Samsung::StreamSelection GetVideoSelection() const;
	bool SetVideoSelection(const std::string &szEncoding, const std::string &szPID = "0");
	Samsung::CaptionState GetCaptionState() const;

	// media playback
	bool Play(const std::string &szSpeed = "1");
	bool Pause();
	bool Stop();
	bool Next();
	bool Previous();
	bool Seek(const std::string &szTarget, const std::string &szUnit = "REL_TIME");
	Samsung::OptionalString GetPlayMode() const;
	bool SetPlayMode(const std::string &szPlayMode = "NORMAL");
	Samsung::TransportInfo GetTransportInfo() const;
	Samsung::TransportSettings GetTransportSettings() const;
	Samsung::PositionInfo GetPositionInfo() const;
	Samsung::MediaInfo GetMediaInfo() const;
	Samsung::DeviceCapabilities GetDeviceCapabilities() const;
	Samsung::StoppedReason GetStoppedReason() const;
	Samsung::OptionalString GetCurrentTransportActions() const;

	// connection manager
	Samsung::OptionalString GetCurrentConnectionIDs() const;
	Samsung::ConnectionInfo GetCurrentConnectionInfo(const std::string &szConnectionID = "0") const;
	Samsung::ProtocolInfo GetProtocolInfo() const;

	// TV agent
	Samsung::OptionalString GetBannerInformation() const;
	Samsung::OptionalString GetCurrentTime() const;
	Samsung::OptionalString GetNetworkInformation() const;
	Samsung::WatchingInformation GetWatchingInformation() const;
	Samsung::OptionalString RunBrowser(const std::string &szURL);
	Samsung::OptionalString RunApp(const std::string &szApplicationID);
	bool SendKeyCode(const std::string &szKeyCode, const std::string &szKeyDescription);
	Samsung::OptionalString StartInstantRecording(const std::string &szChannel);
	Samsung::OptionalString StopRecord(const std::string &szChannel);
	Samsung::OptionalString CheckPIN(const std::string &szPIN);

	// channels and sources
	boost::optional<std::vector<Samsung::Channel> > GetChannels();
	boost::optional<Samsung::Channel> GetChannel();
	// throw std::invalid_argument if the TV has a channel list without the requested channel
	bool SetChannel(const Samsung::Channel &channel);
	bool SetChannel(const int major, const int minor);
	// "major.minor" or "major"
	bool SetChannel(const std::string &szChannel);
	boost::optional<std::vector<Samsung::Source> > GetSources();
	boost::optional<Samsung::Source> GetSource();
	boost::optional<int> GetActiveSourceID() const;
	// throw std::invalid_argument if the TV has a source list without the requested source
	bool SetSource(const int id);
	bool SetSource(const std::string &szName);

	// identification
	boost::optional<Samsung::XML::Node> GetDTVInformation();
	boost::optional<int> GetYear();
	Samsung::OptionalString GetRegion();
	boost::optional<int> GetTunerCount();
	boost::optional<bool> GetDTVSupport();
	boost::optional<bool> GetPVRSupport();
	Samsung::OptionalString GetModel() const;
	Samsung::OptionalString GetPanelTechnology() const;
	Samsung::OptionalString GetPanelType();
	boost::optional<int> GetSize() const;
	Samsung::OptionalString GetDeviceID() const;

	// device info endpoint, an empty object when unavailable
	void SetInfoPort(const uint16_t port) { m_infoPort = port; }
	Json::Value GetTVOptions();
	Json::Value GetIsSupport();
	// "Unknown" when not reported
	std::string GetOperatingSystem();
	std::string GetFirmwareVersion();
	std::string GetNetworkType();
	std::string GetResolution();
	std::string GetTokenAuthSupport();
	std::string GetWifiMac();
	std::string GetVoiceSupport();
	std::string GetFrameTVSupport();
	std::string GetGamePadSupport();
	bool IsAppsListAvailable();
	// isSupport flags such as DMP_DRM_PLAYREADY, DMP_available, remote_touchPad
	bool HasSupportFlag(const std::string &szFlag);

	// throws Samsung::Error on text that is not a number or does not fit an int
	static int ParseInt(const std::string &szValue);
	static bool ParseBool(const std::string &szValue);

protected:
	// registered properties of derived classes take precedence over those of their bases
	void RegisterProperty(const std::string &szName, const Getter &getter, const Setter &setter = Setter());

	bool Invoke(const std::string &szService, const std::string &szAction, const Samsung::UPnP::Arguments &args, Samsung::UPnP::Results &results) const;
	Samsung::OptionalString InvokeValue(const std::string &szService, const std::string &szAction, const Samsung::UPnP::Arguments &args, const size_t index) const;
	Samsung::HTTP::Url GetInfoUrl() const;

	Samsung::Config &m_config;
	samsungCapabilities m_capabilities;

private:
	struct Property
	{
		Getter getter;
		Setter setter;
	};

	void RegisterProperties();
	std::string GetTVOption(const std::string &szName);
	static Samsung::OptionalString At(const Samsung::UPnP::Results &results, const size_t index);

	std::shared_ptr<Samsung::UPnP::Discovery> m_discovery;
	std::map<std::string, std::vector<Property> > m_properties;

	mutable std::mutex m_attributeMutex;
	std::map<std::string, Json::Value> m_attributes;

	std::mutex m_cacheMutex;
	boost::optional<Samsung::XML::Node> m_dtvInformation;
	Json::Value m_tvOptions;
	uint16_t m_infoPort;
};

#endif // _samsungTV
