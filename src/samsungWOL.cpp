/*
 *	Client interface for local Samsung TV access
 *
 *	Hardware address lookup for Wake-on-LAN
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungWOL.hpp"
#include "samsungLog.hpp"
#include <fstream>
#include <sstream>


std::string Samsung::WOL::GetMacAddress(const std::string &szHost, const std::string &szArpTable)
{
	std::ifstream arptable(szArpTable);
	if (!arptable.is_open())
	{
		Samsung::Log::Debug("unable to open " + szArpTable);
		return "";
	}

	// IP address  HW type  Flags  HW address  Mask  Device
	std::string line;
	getline(arptable, line);
	while (getline(arptable, line))
	{
		std::istringstream fields(line);
		std::string szAddress, szType, szFlags, szMac;
		if (!(fields >> szAddress >> szType >> szFlags >> szMac))
			continue;
		if (szAddress != szHost)
			continue;

		// flags 0x0 marks an incomplete entry
		if ((szFlags == "0x0") || (szMac == "00:00:00:00:00:00"))
			return "";

		for (size_t i = 0; i < szMac.length(); i++)
		{
			if ((szMac[i] >= 'A') && (szMac[i] <= 'F'))
				szMac[i] = szMac[i] | 0x20;
		}
		return szMac;
	}
	return "";
}
