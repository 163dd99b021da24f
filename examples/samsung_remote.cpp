/*
 *  Remote control example for local Samsung TV client
 *
 *  Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

//#define APPDEBUG

#include "samsungLegacy.hpp"
#include "samsungConfig.hpp"
#include "samsungErrors.hpp"
#include "samsungLog.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>


int main(int argc, char *argv[])
{
	if (argc < 3)
	{
		fprintf(stderr, "usage %s name KEY_xxx [KEY_xxx ...]\n", argv[0]);
		exit(0);
	}

	Samsung::Config config;
	if (!Samsung::LoadConfig(SAMSUNG_DEVICES_FILE, std::string(argv[1]), config))
	{
		std::cout << "unknown device\n";
		exit(0);
	}

#ifdef APPDEBUG
	Samsung::Log::SetLevel(Samsung::Log::Level::Debug);
	std::cout << "host : " << config.host << "\n";
	std::cout << "method : " << config.method << "\n";
	std::cout << "paired : " << (config.paired ? "yes" : "no") << "\n";
#endif

	if (config.method != "legacy")
	{
		std::cout << "Error: Unsupported connection method " << config.method << "\n";
		exit(0);
	}

	bool waspaired = config.paired;
	samsungLegacy remote(config);
	try
	{
		if (!remote.Open())
		{
			std::cout << "TV at " << config.host << " is not reachable\n";
			return 1;
		}
	}
	catch (const Samsung::Error &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		return 1;
	}

	if (config.paired && !waspaired)
		Samsung::SaveConfig(SAMSUNG_DEVICES_FILE, config);

	int failed = 0;
	for (int i = 2; i < argc; i++)
	{
		if (!remote.Control(std::string(argv[i])))
			failed++;
	}

	try
	{
		remote.Close();
	}
	catch (const Samsung::ShutdownTimeout &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		return 1;
	}

	return (failed > 0) ? 1 : 0;
}
