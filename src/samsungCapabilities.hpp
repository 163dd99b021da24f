/*
 *	Client interface for local Samsung TV access
 *
 *	Capability directory
 *
 *	Holds the UPnP services and devices that were discovered on a TV. The
 *	directory is replaced as a whole after every successful description
 *	retrieval and cleared on disconnect. Readers receive shared snapshots,
 *	so a concurrent rebuild never invalidates a service they are using.
 *	An empty directory is a normal state: callers treat every lookup as
 *	optional.
 *
 *	 - Resolve(service, action)
 *		Returns an ActionHandle that evaluates false when the service or
 *		the action is not available on this TV
 *	 - GetService(name) / GetDevice(name) / operator[](name)
 *		Return nullptr when absent
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungCapabilities
#define _samsungCapabilities

#include "samsungUPnP.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>


namespace Samsung {

class ActionHandle
{
public:
	ActionHandle() {}
	ActionHandle(const std::shared_ptr<UPnP::Service> &service, const std::string &szAction);

	explicit operator bool() const { return (bool)m_service; }

	// throws std::logic_error on an empty handle
	UPnP::Results operator()(const UPnP::Arguments &args = UPnP::Arguments()) const;

	const std::string &GetAction() const { return m_action; }
	std::shared_ptr<UPnP::Service> GetService() const { return m_service; }

private:
	std::shared_ptr<UPnP::Service> m_service;
	std::string m_action;
};

}; // namespace Samsung


class samsungCapabilities
{
public:
	samsungCapabilities();

	// replace the directory contents with the given device trees
	void Rebuild(const std::vector<std::shared_ptr<Samsung::UPnP::Device> > &devices);
	void Clear();

	bool IsEmpty() const;
	// incremented on every Rebuild() and Clear()
	unsigned int GetGeneration() const;

	std::shared_ptr<Samsung::UPnP::Service> GetService(const std::string &szName) const;
	std::shared_ptr<Samsung::UPnP::Device> GetDevice(const std::string &szName) const;
	bool HasService(const std::string &szName) const;
	bool HasDevice(const std::string &szName) const;
	std::shared_ptr<Samsung::UPnP::Service> operator[](const std::string &szName) const;

	std::vector<std::string> GetServiceNames() const;
	std::vector<std::string> GetDeviceNames() const;

	Samsung::ActionHandle Resolve(const std::string &szService, const std::string &szAction) const;

private:
	struct Snapshot
	{
		std::map<std::string, std::shared_ptr<Samsung::UPnP::Service> > services;
		std::map<std::string, std::shared_ptr<Samsung::UPnP::Device> > devices;
	};

	std::shared_ptr<const Snapshot> GetSnapshot() const;
	static void AddDevice(Snapshot &snapshot, const std::shared_ptr<Samsung::UPnP::Device> &device);

	mutable std::mutex m_mutex;
	std::shared_ptr<const Snapshot> m_snapshot;
	unsigned int m_generation;
};

#endif // _samsungCapabilities
