/*
 *	Client interface for local Samsung TV access
 *
 *	Hardware address lookup for Wake-on-LAN
 *
 *	 - GetMacAddress(host)
 *		Looks up `host` (an IPv4 address) in the kernel ARP table. The TV
 *		must have been in contact with this machine recently for an entry
 *		to exist.
 *		Returns the address as "aa:bb:cc:dd:ee:ff" or an empty string
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungWOL
#define _samsungWOL

#ifndef ARP_TABLE
#define ARP_TABLE "/proc/net/arp"
#endif

#include <string>


namespace Samsung {
  namespace WOL {

	std::string GetMacAddress(const std::string &szHost, const std::string &szArpTable = ARP_TABLE);

  }; // namespace WOL
}; // namespace Samsung

#endif // _samsungWOL
