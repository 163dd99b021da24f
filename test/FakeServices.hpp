/*
 *	In-memory UPnP services for the unit tests
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _testFakeServices
#define _testFakeServices

#include "samsungUPnP.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <thread>


class FakeService : public Samsung::UPnP::Service
{
public:
	typedef std::function<Samsung::UPnP::Results(const Samsung::UPnP::Arguments&)> Handler;

	struct Call
	{
		std::string action;
		Samsung::UPnP::Arguments args;
	};

	explicit FakeService(const std::string &szName) :
		Samsung::UPnP::Service(szName, "urn:schemas-upnp-org:service:" + szName + ":1")
	{
	}

	void Add(const std::string &szAction, const Handler &handler)
	{
		Samsung::UPnP::ActionInfo action;
		action.name = szAction;
		AddAction(action);
		std::lock_guard<std::mutex> lock(m_mutex);
		m_handlers[szAction] = handler;
	}

	void Reply(const std::string &szAction, const Samsung::UPnP::Results &results)
	{
		Add(szAction, [results](const Samsung::UPnP::Arguments &) { return results; });
	}

	Samsung::UPnP::Results Invoke(const std::string &szAction, const Samsung::UPnP::Arguments &args) override
	{
		Handler handler;
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			Call call;
			call.action = szAction;
			call.args = args;
			m_calls.push_back(call);

			std::map<std::string, Handler>::const_iterator it = m_handlers.find(szAction);
			if (it == m_handlers.end())
				throw std::invalid_argument("no fake for " + szAction);
			handler = it->second;
		}
		return handler(args);
	}

	std::vector<Call> GetCalls(const std::string &szAction) const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		std::vector<Call> calls;
		for (size_t i = 0; i < m_calls.size(); i++)
		{
			if (m_calls[i].action == szAction)
				calls.push_back(m_calls[i]);
		}
		return calls;
	}

private:
	mutable std::mutex m_mutex;
	std::map<std::string, Handler> m_handlers;
	std::vector<Call> m_calls;
};


class FakeDiscovery : public Samsung::UPnP::Discovery
{
public:
	FakeDiscovery() : m_calls(0) {}

	void AddDevice(const std::shared_ptr<Samsung::UPnP::Device> &device)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_devices.push_back(device);
	}

	std::vector<std::shared_ptr<Samsung::UPnP::Device> > Describe(const std::string &szHost, const std::vector<std::string> &locations) override
	{
		(void)szHost;
		(void)locations;
		m_calls++;
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_devices;
	}

	int GetCallCount() const { return m_calls; }

private:
	std::mutex m_mutex;
	std::vector<std::shared_ptr<Samsung::UPnP::Device> > m_devices;
	std::atomic<int> m_calls;
};


inline std::shared_ptr<Samsung::UPnP::Device> MakeDevice(const std::string &szName, const std::vector<std::shared_ptr<Samsung::UPnP::Service> > &services)
{
	std::shared_ptr<Samsung::UPnP::Device> device = std::make_shared<Samsung::UPnP::Device>(szName, "urn:schemas-upnp-org:device:" + szName + ":1");
	device->services = services;
	return device;
}


template <typename Predicate>
bool WaitUntil(Predicate predicate, const int timeout)
{
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout);
	while (!predicate())
	{
		if (std::chrono::steady_clock::now() > deadline)
			return false;
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
	return true;
}

#endif // _testFakeServices
