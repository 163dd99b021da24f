/*
 *	Unit tests for the capability directory
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungCapabilities.hpp"
#include "FakeServices.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <atomic>


namespace {

std::vector<std::shared_ptr<Samsung::UPnP::Device> > MakeTree(std::shared_ptr<FakeService> &renderingControl, std::shared_ptr<FakeService> &agent)
{
	renderingControl = std::make_shared<FakeService>("RenderingControl");
	renderingControl->Reply("GetVolume", Samsung::UPnP::Results(1, "10"));
	agent = std::make_shared<FakeService>("MainTVAgent2");
	agent->Reply("GetVolume", Samsung::UPnP::Results(2, "20"));

	std::vector<std::shared_ptr<Samsung::UPnP::Service> > services;
	services.push_back(renderingControl);
	std::shared_ptr<Samsung::UPnP::Device> renderer = MakeDevice("MediaRenderer", services);

	services.clear();
	services.push_back(agent);
	renderer->devices.push_back(MakeDevice("MainTVServer2", services));

	std::vector<std::shared_ptr<Samsung::UPnP::Device> > devices;
	devices.push_back(renderer);
	return devices;
}

}; // namespace


TEST(Capabilities, EmptyDirectory)
{
	samsungCapabilities capabilities;
	EXPECT_TRUE(capabilities.IsEmpty());
	EXPECT_FALSE(capabilities.HasService("RenderingControl"));
	EXPECT_FALSE((bool)capabilities["RenderingControl"]);
	EXPECT_FALSE((bool)capabilities.Resolve("RenderingControl", "GetVolume"));
	EXPECT_TRUE(capabilities.GetServiceNames().empty());
}


TEST(Capabilities, RebuildIndexesNestedDevices)
{
	std::shared_ptr<FakeService> renderingControl;
	std::shared_ptr<FakeService> agent;
	samsungCapabilities capabilities;
	capabilities.Rebuild(MakeTree(renderingControl, agent));

	EXPECT_FALSE(capabilities.IsEmpty());
	EXPECT_TRUE(capabilities.HasDevice("MediaRenderer"));
	EXPECT_TRUE(capabilities.HasDevice("MainTVServer2"));
	EXPECT_TRUE(capabilities.HasService("RenderingControl"));
	EXPECT_TRUE(capabilities.HasService("MainTVAgent2"));
	EXPECT_EQ(renderingControl, capabilities["RenderingControl"]);

	std::vector<std::string> names = capabilities.GetServiceNames();
	ASSERT_EQ(2u, names.size());
	EXPECT_EQ("MainTVAgent2", names[0]);
	EXPECT_EQ("RenderingControl", names[1]);
}


TEST(Capabilities, ResolveRequiresAction)
{
	std::shared_ptr<FakeService> renderingControl;
	std::shared_ptr<FakeService> agent;
	samsungCapabilities capabilities;
	capabilities.Rebuild(MakeTree(renderingControl, agent));

	Samsung::ActionHandle getVolume = capabilities.Resolve("MainTVAgent2", "GetVolume");
	ASSERT_TRUE((bool)getVolume);
	EXPECT_EQ("GetVolume", getVolume.GetAction());
	Samsung::UPnP::Results results = getVolume();
	ASSERT_EQ(2u, results.size());
	EXPECT_EQ("20", results[1]);

	EXPECT_FALSE((bool)capabilities.Resolve("MainTVAgent2", "SetVolume"));
	EXPECT_FALSE((bool)capabilities.Resolve("AVTransport", "Play"));
}


TEST(Capabilities, EmptyHandleRefusesInvocation)
{
	Samsung::ActionHandle handle;
	EXPECT_FALSE((bool)handle);
	EXPECT_THROW(handle(), std::logic_error);
}


TEST(Capabilities, FirstServiceClaimsName)
{
	std::shared_ptr<FakeService> first = std::make_shared<FakeService>("RenderingControl");
	std::shared_ptr<FakeService> second = std::make_shared<FakeService>("RenderingControl");

	std::vector<std::shared_ptr<Samsung::UPnP::Device> > devices;
	devices.push_back(MakeDevice("MediaRenderer", std::vector<std::shared_ptr<Samsung::UPnP::Service> >(1, first)));
	devices.push_back(MakeDevice("MediaRenderer", std::vector<std::shared_ptr<Samsung::UPnP::Service> >(1, second)));

	samsungCapabilities capabilities;
	capabilities.Rebuild(devices);
	EXPECT_EQ(first, capabilities.GetService("RenderingControl"));
	EXPECT_EQ(devices[0], capabilities.GetDevice("MediaRenderer"));
}


TEST(Capabilities, ClearAndGeneration)
{
	std::shared_ptr<FakeService> renderingControl;
	std::shared_ptr<FakeService> agent;
	samsungCapabilities capabilities;
	unsigned int generation = capabilities.GetGeneration();

	capabilities.Rebuild(MakeTree(renderingControl, agent));
	EXPECT_EQ(generation + 1, capabilities.GetGeneration());

	// a handle resolved before the clear keeps its service alive
	Samsung::ActionHandle getVolume = capabilities.Resolve("RenderingControl", "GetVolume");
	capabilities.Clear();
	EXPECT_EQ(generation + 2, capabilities.GetGeneration());
	EXPECT_TRUE(capabilities.IsEmpty());
	EXPECT_FALSE((bool)capabilities.Resolve("RenderingControl", "GetVolume"));
	ASSERT_TRUE((bool)getVolume);
	EXPECT_EQ("10", getVolume()[0]);
}


TEST(Capabilities, ConcurrentReadersDuringRebuild)
{
	std::shared_ptr<FakeService> renderingControl;
	std::shared_ptr<FakeService> agent;
	std::vector<std::shared_ptr<Samsung::UPnP::Device> > devices = MakeTree(renderingControl, agent);
	samsungCapabilities capabilities;

	std::atomic<bool> stop(false);
	std::atomic<int> found(0);
	std::thread reader([&]()
	{
		while (!stop)
		{
			std::shared_ptr<Samsung::UPnP::Service> service = capabilities.GetService("RenderingControl");
			// a reader sees either the complete directory or an empty one
			if (service)
			{
				EXPECT_EQ("RenderingControl", service->GetName());
				found++;
			}
		}
	});

	for (int i = 0; i < 500; i++)
	{
		capabilities.Rebuild(devices);
		capabilities.Clear();
	}
	capabilities.Rebuild(devices);
	WaitUntil([&]() { return found > 0; }, 2000);
	stop = true;
	reader.join();
	EXPECT_GT(found, 0);
}
