/*
 *	Client interface for local Samsung TV access
 *
 *	Connection settings for a single TV
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungConfig.hpp"
#include "samsungLog.hpp"
#include <fstream>
#include <sstream>
#include <memory>


namespace {

std::string ToLower(const std::string &szInput)
{
	std::string szResult = szInput;
	for (size_t i = 0; i < szResult.length(); i++)
	{
		if ((szResult[i] >= 'A') && (szResult[i] <= 'Z'))
			szResult[i] = szResult[i] | 0x20;
	}
	return szResult;
}


bool ReadDevicesFile(const std::string &szFile, Json::Value &jRoot)
{
	std::ifstream myfile(szFile);
	if (!myfile.is_open())
		return false;

	std::stringstream ss;
	ss << myfile.rdbuf();
	std::string szFileContent = ss.str();
	myfile.close();

	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!jReader->parse(szFileContent.c_str(), szFileContent.c_str() + szFileContent.size(), &jRoot, &szErrors))
	{
		Samsung::Log::Error("unable to parse " + szFile + ": " + szErrors);
		return false;
	}
	return true;
}

}; // namespace


Samsung::Config Samsung::ConfigFromJson(const Json::Value &jDevice)
{
	Config config;
	if (jDevice.isMember("name"))
		config.name = jDevice["name"].asString();
	if (jDevice.isMember("description"))
		config.description = jDevice["description"].asString();
	if (jDevice.isMember("method"))
		config.method = jDevice["method"].asString();
	config.id = jDevice["id"].asString();
	config.host = jDevice["host"].asString();
	config.port = (uint16_t)jDevice["port"].asUInt();
	config.mac = jDevice["mac"].asString();
	config.paired = jDevice["paired"].asBool();
	config.token = jDevice["token"].asString();
	config.timeout = jDevice["timeout"].asInt();
	config.pairing_timeout = jDevice["pairing_timeout"].asInt();

	const Json::Value &jLocations = jDevice["upnp_locations"];
	if (jLocations.isArray())
	{
		for (Json::ArrayIndex i = 0; i < jLocations.size(); i++)
			config.upnp_locations.push_back(jLocations[i].asString());
	}
	return config;
}


Json::Value Samsung::ConfigToJson(const Config &config)
{
	Json::Value jDevice;
	jDevice["name"] = config.name;
	jDevice["description"] = config.description;
	jDevice["id"] = config.id;
	jDevice["host"] = config.host;
	jDevice["port"] = config.port;
	jDevice["method"] = config.method;
	jDevice["mac"] = config.mac;
	jDevice["paired"] = config.paired;
	jDevice["token"] = config.token;
	jDevice["timeout"] = config.timeout;
	jDevice["pairing_timeout"] = config.pairing_timeout;

	jDevice["upnp_locations"] = Json::Value(Json::arrayValue);
	for (size_t i = 0; i < config.upnp_locations.size(); i++)
		jDevice["upnp_locations"].append(config.upnp_locations[i]);
	return jDevice;
}


bool Samsung::LoadConfig(const std::string &szFile, const std::string &szName, Config &config)
{
	Json::Value jRoot;
	if (!ReadDevicesFile(szFile, jRoot))
		return false;

	const Json::Value &jDevices = jRoot["devices"];
	if (!jDevices.isArray())
		return false;

	std::string szLowerName = ToLower(szName);
	for (Json::ArrayIndex i = 0; i < jDevices.size(); i++)
	{
		if (ToLower(jDevices[i]["name"].asString()) == szLowerName)
		{
			config = ConfigFromJson(jDevices[i]);
			return true;
		}
	}
	return false;
}


bool Samsung::SaveConfig(const std::string &szFile, const Config &config)
{
	Json::Value jRoot;
	if (!ReadDevicesFile(szFile, jRoot))
		jRoot = Json::Value(Json::objectValue);
	if (!jRoot["devices"].isArray())
		jRoot["devices"] = Json::Value(Json::arrayValue);

	Json::Value &jDevices = jRoot["devices"];
	std::string szLowerName = ToLower(config.name);
	bool replaced = false;
	for (Json::ArrayIndex i = 0; i < jDevices.size(); i++)
	{
		if (ToLower(jDevices[i]["name"].asString()) == szLowerName)
		{
			jDevices[i] = ConfigToJson(config);
			replaced = true;
			break;
		}
	}
	if (!replaced)
		jDevices.append(ConfigToJson(config));

	std::ofstream myfile(szFile, std::ios::trunc);
	if (!myfile.is_open())
	{
		Samsung::Log::Error("unable to write " + szFile);
		return false;
	}

	Json::StreamWriterBuilder jWriter;
	jWriter["indentation"] = "\t";
	myfile << Json::writeString(jWriter, jRoot) << "\n";
	myfile.close();
	return !myfile.fail();
}
