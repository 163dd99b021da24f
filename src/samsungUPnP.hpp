/*
 *	Client interface for local Samsung TV access
 *
 *	UPnP control point plumbing
 *
 *	A TV publishes one or more device descriptions. Each device lists its
 *	services, each service publishes a description (SCPD) with the actions
 *	it supports. Actions take positional string arguments and return an
 *	ordered list of string results.
 *
 *	 - Samsung::UPnP::Service
 *		Abstract remote service. SoapService invokes actions over SOAP 1.1,
 *		tests and applications may provide their own implementations.
 *	 - Samsung::UPnP::Discovery
 *		Builds the device tree for a TV. DescriptionLoader fetches the
 *		description documents from the configured locations.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungUPnP
#define _samsungUPnP

#define UPNP_REQUEST_TIMEOUT_MSECS 5000

#include "samsungErrors.hpp"
#include "samsungHTTP.hpp"
#include "samsungXML.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>


namespace Samsung {
  namespace UPnP {

	typedef std::vector<std::string> Arguments;
	typedef std::vector<std::string> Results;


	// the TV rejected an action invocation or the request could not be delivered
	class ActionFailed : public Samsung::Error
	{
	public:
		ActionFailed(const std::string &szAction, const int code, const std::string &szDescription)
			: Samsung::Error("action " + szAction + " failed (" + std::to_string(code) + "): " + szDescription), m_code(code) {}

		int code() const { return m_code; }

	private:
		int m_code;
	};


	struct ActionInfo
	{
		std::string name;
		std::vector<std::string> in;
		std::vector<std::string> out;
	};


	class Service
	{
	public:
		virtual ~Service() {}

		const std::string &GetName() const { return m_name; }
		const std::string &GetServiceType() const { return m_serviceType; }

		bool HasAction(const std::string &szAction) const;
		std::vector<std::string> GetActionNames() const;
		void AddAction(const ActionInfo &action);

		// description fields of the owning device (modelName, deviceID, ...)
		bool GetAttribute(const std::string &szName, std::string &szValue) const;
		void SetAttribute(const std::string &szName, const std::string &szValue);

		virtual Results Invoke(const std::string &szAction, const Arguments &args) = 0;

	protected:
		Service(const std::string &szName, const std::string &szServiceType);

		const ActionInfo *GetActionInfo(const std::string &szAction) const;

		std::string m_name;
		std::string m_serviceType;
		std::map<std::string, ActionInfo> m_actions;
		std::map<std::string, std::string> m_attributes;
	};


	class SoapService : public Service
	{
	public:
		SoapService(const std::string &szName, const std::string &szServiceType, const std::string &szControlURL, const int timeout = UPNP_REQUEST_TIMEOUT_MSECS);

		Results Invoke(const std::string &szAction, const Arguments &args) override;

		static std::string BuildEnvelope(const std::string &szServiceType, const ActionInfo &action, const Arguments &args);
		// throws ActionFailed on SOAP faults, Samsung::XMLError on malformed replies
		static Results ParseResponse(const ActionInfo &action, const unsigned int status, const std::string &szBody);

	private:
		std::string m_controlURL;
		int m_timeout;
	};


	class Device
	{
	public:
		Device(const std::string &szName, const std::string &szDeviceType);

		const std::string &GetName() const { return m_name; }
		const std::string &GetDeviceType() const { return m_deviceType; }

		std::map<std::string, std::string> attributes;
		std::vector<std::shared_ptr<Service> > services;
		std::vector<std::shared_ptr<Device> > devices;

	private:
		std::string m_name;
		std::string m_deviceType;
	};


	class Discovery
	{
	public:
		virtual ~Discovery() {}

		// an empty result means nothing could be retrieved, which is not an error
		virtual std::vector<std::shared_ptr<Device> > Describe(const std::string &szHost, const std::vector<std::string> &locations) = 0;
	};


	class DescriptionLoader : public Discovery
	{
	public:
		explicit DescriptionLoader(const int timeout = UPNP_REQUEST_TIMEOUT_MSECS);

		std::vector<std::shared_ptr<Device> > Describe(const std::string &szHost, const std::vector<std::string> &locations) override;

		// build a device tree from a description document that was already retrieved
		std::shared_ptr<Device> BuildDevice(const Samsung::XML::Node &device, const std::string &szBaseURL, const bool fetchSCPD);

		static void ParseSCPD(const Samsung::XML::Node &scpd, Service &service);

	private:
		bool Fetch(const std::string &szUrl, std::string &szBody);

		int m_timeout;
	};

	// "urn:upnp-org:serviceId:RenderingControl" -> "RenderingControl"
	std::string ServiceShortName(const std::string &szServiceId);
	// "urn:schemas-upnp-org:device:MediaRenderer:1" -> "MediaRenderer"
	std::string DeviceShortName(const std::string &szDeviceType);

  }; // namespace UPnP
}; // namespace Samsung

#endif // _samsungUPnP
