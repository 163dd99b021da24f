/*
 *  Status example for local Samsung TV client
 *
 *  Prints what the TV reports through its UPnP services
 *
 *  Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungTV.hpp"
#include "samsungConfig.hpp"
#include "samsungErrors.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>


template <typename T>
void print_value(const std::string &szLabel, const boost::optional<T> &value)
{
	std::cout << szLabel << ": ";
	if (value)
		std::cout << *value;
	else
		std::cout << "n/a";
	std::cout << "\n";
}


int main(int argc, char *argv[])
{
	if (argc < 2)
	{
		fprintf(stderr, "usage %s name\n", argv[0]);
		exit(0);
	}

	Samsung::Config config;
	if (!Samsung::LoadConfig(SAMSUNG_DEVICES_FILE, std::string(argv[1]), config))
	{
		std::cout << "unknown device\n";
		exit(0);
	}

	if (config.upnp_locations.empty())
	{
		std::cout << "Error: no upnp_locations configured for " << config.name << "\n";
		exit(0);
	}

	samsungTV tv(config);
	tv.Connect();
	if (tv.GetCapabilities().IsEmpty())
	{
		std::cout << "TV at " << config.host << " did not describe any services\n";
		return 1;
	}

	try
	{
		print_value("model", tv.GetModel());
		print_value("year", tv.GetYear());
		print_value("size", tv.GetSize());
		print_value("panel", tv.GetPanelTechnology());
		print_value("region", tv.GetRegion());
		print_value("volume", tv.GetVolume());
		print_value("mute", tv.GetMute());

		boost::optional<Samsung::Channel> channel = tv.GetChannel();
		if (channel)
			std::cout << "channel: " << channel->GetMajor() << "." << channel->GetMinor() << " " << channel->GetName() << "\n";

		boost::optional<std::vector<Samsung::Source> > sources = tv.GetSources();
		if (sources)
		{
			for (size_t i = 0; i < sources->size(); i++)
			{
				const Samsung::Source &source = (*sources)[i];
				std::cout << "source " << source.GetID() << ": " << source.GetLabel();
				if (source.IsActive())
					std::cout << " (active)";
				std::cout << "\n";
			}
		}
	}
	catch (const Samsung::Error &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}
