/*
 *	Client interface for local Samsung TV access
 *
 *	UPnP control point plumbing
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungUPnP.hpp"
#include "samsungLog.hpp"
#include <stdexcept>
#include <cstdlib>


/* private */ const Samsung::UPnP::ActionInfo *Samsung::UPnP::Service::GetActionInfo(const std::string &szAction) const
{
	std::map<std::string, ActionInfo>::const_iterator it = m_actions.find(szAction);
	if (it == m_actions.end())
		return nullptr;
	return &it->second;
}


Samsung::UPnP::Service::Service(const std::string &szName, const std::string &szServiceType) :
	m_name(szName),
	m_serviceType(szServiceType)
{
}


bool Samsung::UPnP::Service::HasAction(const std::string &szAction) const
{
	return m_actions.find(szAction) != m_actions.end();
}


std::vector<std::string> Samsung::UPnP::Service::GetActionNames() const
{
	std::vector<std::string> names;
	for (std::map<std::string, ActionInfo>::const_iterator it = m_actions.begin(); it != m_actions.end(); ++it)
		names.push_back(it->first);
	return names;
}


void Samsung::UPnP::Service::AddAction(const ActionInfo &action)
{
	m_actions[action.name] = action;
}


bool Samsung::UPnP::Service::GetAttribute(const std::string &szName, std::string &szValue) const
{
	std::map<std::string, std::string>::const_iterator it = m_attributes.find(szName);
	if (it == m_attributes.end())
		return false;
	szValue = it->second;
	return true;
}


void Samsung::UPnP::Service::SetAttribute(const std::string &szName, const std::string &szValue)
{
	m_attributes[szName] = szValue;
}


/* ---------------------------------------------------------------------------------------------------------------- */


Samsung::UPnP::SoapService::SoapService(const std::string &szName, const std::string &szServiceType, const std::string &szControlURL, const int timeout) :
	Service(szName, szServiceType),
	m_controlURL(szControlURL),
	m_timeout(timeout)
{
}


std::string Samsung::UPnP::SoapService::BuildEnvelope(const std::string &szServiceType, const ActionInfo &action, const Arguments &args)
{
	std::string szEnvelope = "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
		"<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
		"<s:Body>";
	szEnvelope.append("<u:" + action.name + " xmlns:u=\"" + Samsung::XML::Escape(szServiceType) + "\">");
	for (size_t i = 0; i < action.in.size(); i++)
		szEnvelope.append("<" + action.in[i] + ">" + Samsung::XML::Escape(args[i]) + "</" + action.in[i] + ">");
	szEnvelope.append("</u:" + action.name + ">");
	szEnvelope.append("</s:Body></s:Envelope>");
	return szEnvelope;
}


Samsung::UPnP::Results Samsung::UPnP::SoapService::ParseResponse(const ActionInfo &action, const unsigned int status, const std::string &szBody)
{
	Samsung::XML::Node envelope = Samsung::XML::Parse(szBody);
	const Samsung::XML::Node *body = envelope.Find("Body");
	if (body == nullptr)
		throw Samsung::XMLError("SOAP reply without Body");

	const Samsung::XML::Node *fault = body->Find("Fault");
	if (fault != nullptr)
	{
		int code = 0;
		std::string szDescription = fault->FindText("faultstring", "SOAP fault");
		const Samsung::XML::Node *detail = fault->Find("detail");
		const Samsung::XML::Node *upnperror = (detail == nullptr) ? nullptr : detail->Find("UPnPError");
		if (upnperror != nullptr)
		{
			code = atoi(upnperror->FindText("errorCode", "0").c_str());
			szDescription = upnperror->FindText("errorDescription", szDescription);
		}
		throw ActionFailed(action.name, code, szDescription);
	}

	const Samsung::XML::Node *reply = body->Find(action.name + "Response");
	if (reply == nullptr)
	{
		if (status != 200)
			throw ActionFailed(action.name, (int)status, "HTTP error");
		throw Samsung::XMLError("SOAP reply without " + action.name + "Response");
	}

	Results results;
	if (action.out.empty())
	{
		for (size_t i = 0; i < reply->children.size(); i++)
			results.push_back(reply->children[i].text);
		return results;
	}

	// order by the declared out arguments, the TV does not always keep it
	for (size_t i = 0; i < action.out.size(); i++)
		results.push_back(reply->FindText(action.out[i]));
	return results;
}


Samsung::UPnP::Results Samsung::UPnP::SoapService::Invoke(const std::string &szAction, const Arguments &args)
{
	const ActionInfo *action = GetActionInfo(szAction);
	if (action == nullptr)
		throw std::invalid_argument("service " + m_name + " has no action " + szAction);
	if (args.size() != action->in.size())
		throw std::invalid_argument("action " + szAction + " takes " + std::to_string(action->in.size()) + " arguments, " + std::to_string(args.size()) + " given");

	Samsung::HTTP::Url url;
	if (!Samsung::HTTP::ParseUrl(m_controlURL, url))
		throw ActionFailed(szAction, 0, "invalid control url " + m_controlURL);

	Samsung::HTTP::Headers headers;
	headers.push_back(std::make_pair("Content-Type", "text/xml; charset=\"utf-8\""));
	headers.push_back(std::make_pair("SOAPACTION", "\"" + m_serviceType + "#" + szAction + "\""));

	Samsung::Log::Debug("invoke " + m_name + "." + szAction);
	Samsung::HTTP::Response response;
	if (!Samsung::HTTP::Post(url, headers, BuildEnvelope(m_serviceType, *action, args), m_timeout, response))
		throw ActionFailed(szAction, 0, "no response from " + url.host);

	return ParseResponse(*action, response.status, response.body);
}


/* ---------------------------------------------------------------------------------------------------------------- */


Samsung::UPnP::Device::Device(const std::string &szName, const std::string &szDeviceType) :
	m_name(szName),
	m_deviceType(szDeviceType)
{
}


/* ---------------------------------------------------------------------------------------------------------------- */


std::string Samsung::UPnP::ServiceShortName(const std::string &szServiceId)
{
	size_t separator = szServiceId.rfind(':');
	if (separator == std::string::npos)
		return szServiceId;
	return szServiceId.substr(separator + 1);
}


std::string Samsung::UPnP::DeviceShortName(const std::string &szDeviceType)
{
	// urn:<domain>:device:<name>:<version>
	std::vector<std::string> parts;
	size_t start = 0;
	while (true)
	{
		size_t separator = szDeviceType.find(':', start);
		parts.push_back(szDeviceType.substr(start, (separator == std::string::npos) ? std::string::npos : separator - start));
		if (separator == std::string::npos)
			break;
		start = separator + 1;
	}
	if (parts.size() >= 4)
		return parts[3];
	return szDeviceType;
}


Samsung::UPnP::DescriptionLoader::DescriptionLoader(const int timeout) :
	m_timeout(timeout)
{
}


/* private */ bool Samsung::UPnP::DescriptionLoader::Fetch(const std::string &szUrl, std::string &szBody)
{
	Samsung::HTTP::Url url;
	if (!Samsung::HTTP::ParseUrl(szUrl, url))
	{
		Samsung::Log::Warning("ignoring invalid description url " + szUrl);
		return false;
	}

	Samsung::HTTP::Response response;
	if (!Samsung::HTTP::Get(url, m_timeout, response))
		return false;
	if (response.status != 200)
	{
		Samsung::Log::Debug("GET " + szUrl + " returned status " + std::to_string(response.status));
		return false;
	}
	szBody = response.body;
	return true;
}


void Samsung::UPnP::DescriptionLoader::ParseSCPD(const Samsung::XML::Node &scpd, Service &service)
{
	const Samsung::XML::Node *actionList = scpd.Find("actionList");
	if (actionList == nullptr)
		return;

	for (size_t i = 0; i < actionList->children.size(); i++)
	{
		const Samsung::XML::Node &actionNode = actionList->children[i];
		if (actionNode.name != "action")
			continue;

		ActionInfo action;
		action.name = actionNode.FindText("name");
		if (action.name.empty())
			continue;

		const Samsung::XML::Node *argumentList = actionNode.Find("argumentList");
		if (argumentList != nullptr)
		{
			for (size_t j = 0; j < argumentList->children.size(); j++)
			{
				const Samsung::XML::Node &argument = argumentList->children[j];
				if (argument.name != "argument")
					continue;
				if (argument.FindText("direction") == "out")
					action.out.push_back(argument.FindText("name"));
				else
					action.in.push_back(argument.FindText("name"));
			}
		}
		service.AddAction(action);
	}
}


std::shared_ptr<Samsung::UPnP::Device> Samsung::UPnP::DescriptionLoader::BuildDevice(const Samsung::XML::Node &deviceNode, const std::string &szBaseURL, const bool fetchSCPD)
{
	std::string szDeviceType = deviceNode.FindText("deviceType");
	std::shared_ptr<Device> device = std::make_shared<Device>(DeviceShortName(szDeviceType), szDeviceType);

	// leaf fields of the description become attributes of the device and its services
	for (size_t i = 0; i < deviceNode.children.size(); i++)
	{
		if (deviceNode.children[i].children.empty())
			device->attributes[deviceNode.children[i].name] = deviceNode.children[i].text;
	}

	const Samsung::XML::Node *serviceList = deviceNode.Find("serviceList");
	if (serviceList != nullptr)
	{
		for (size_t i = 0; i < serviceList->children.size(); i++)
		{
			const Samsung::XML::Node &serviceNode = serviceList->children[i];
			if (serviceNode.name != "service")
				continue;

			std::string szControlURL = Samsung::HTTP::ResolveUrl(szBaseURL, serviceNode.FindText("controlURL"));
			std::shared_ptr<SoapService> service = std::make_shared<SoapService>(ServiceShortName(serviceNode.FindText("serviceId")), serviceNode.FindText("serviceType"), szControlURL, m_timeout);
			for (std::map<std::string, std::string>::const_iterator it = device->attributes.begin(); it != device->attributes.end(); ++it)
				service->SetAttribute(it->first, it->second);

			std::string szSCPD;
			if (fetchSCPD && Fetch(Samsung::HTTP::ResolveUrl(szBaseURL, serviceNode.FindText("SCPDURL")), szSCPD))
			{
				try
				{
					ParseSCPD(Samsung::XML::Parse(szSCPD), *service);
				}
				catch (const Samsung::XMLError &e)
				{
					Samsung::Log::Warning("service " + service->GetName() + " description is malformed: " + e.what());
				}
			}
			device->services.push_back(service);
		}
	}

	const Samsung::XML::Node *deviceList = deviceNode.Find("deviceList");
	if (deviceList != nullptr)
	{
		for (size_t i = 0; i < deviceList->children.size(); i++)
		{
			if (deviceList->children[i].name == "device")
				device->devices.push_back(BuildDevice(deviceList->children[i], szBaseURL, fetchSCPD));
		}
	}
	return device;
}


std::vector<std::shared_ptr<Samsung::UPnP::Device> > Samsung::UPnP::DescriptionLoader::Describe(const std::string &szHost, const std::vector<std::string> &locations)
{
	std::vector<std::shared_ptr<Device> > devices;
	for (size_t i = 0; i < locations.size(); i++)
	{
		std::string szDescription;
		if (!Fetch(locations[i], szDescription))
		{
			Samsung::Log::Info("no UPnP description at " + locations[i]);
			continue;
		}

		Samsung::XML::Node root;
		try
		{
			root = Samsung::XML::Parse(szDescription);
		}
		catch (const Samsung::XMLError &e)
		{
			Samsung::Log::Warning("UPnP description at " + locations[i] + " is malformed: " + e.what());
			continue;
		}

		const Samsung::XML::Node *deviceNode = root.Find("device");
		if (deviceNode == nullptr)
			continue;

		std::string szBase = root.FindText("URLBase", locations[i]);
		devices.push_back(BuildDevice(*deviceNode, szBase, true));
	}
	Samsung::Log::Debug("found " + std::to_string(devices.size()) + " UPnP devices on " + szHost);
	return devices;
}
