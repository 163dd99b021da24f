/*
 *	Client interface for local Samsung TV access
 *
 *	Connection settings for a single TV
 *
 *	Settings are kept in a JSON file (samsung-devices.json by default):
 *	{
 *		"devices": [
 *			{ "name": "livingroom", "host": "192.168.1.20", "method": "legacy", ... }
 *		]
 *	}
 *
 *	 - LoadConfig(file, name, config)
 *		Looks up a device by name (case insensitive)
 *		Returns true|false indicating if the device was found
 *	 - SaveConfig(file, config)
 *		Inserts or replaces the device entry with the same name, so that
 *		pairing state and a resolved MAC address survive a restart
 *		Returns true|false indicating success or failure
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungConfig
#define _samsungConfig

#ifndef SAMSUNG_DEVICES_FILE
#define SAMSUNG_DEVICES_FILE "samsung-devices.json"
#endif

#include <json/json.h>
#include <string>
#include <vector>
#include <cstdint>


namespace Samsung {

struct Config
{
	std::string name = "samsungctl";
	std::string description = "PC";
	std::string id;
	std::string host;
	// 0 selects the default port of the connection method
	uint16_t port = 0;
	std::string method = "legacy";
	std::string mac;
	bool paired = false;
	std::string token;
	// seconds, 0 means no timeout
	int timeout = 0;
	// seconds to wait for the user to confirm pairing on the TV, 0 waits until closed
	int pairing_timeout = 0;
	std::vector<std::string> upnp_locations;
};

Config ConfigFromJson(const Json::Value &jDevice);
Json::Value ConfigToJson(const Config &config);

bool LoadConfig(const std::string &szFile, const std::string &szName, Config &config);
bool SaveConfig(const std::string &szFile, const Config &config);

}; // namespace Samsung

#endif // _samsungConfig
