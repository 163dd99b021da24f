/*
 *	Client interface for local Samsung TV access
 *
 *	Capability directory
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
#include "samsungLog.hpp"
#include <stdexcept>


Samsung::ActionHandle::ActionHandle(const std::shared_ptr<UPnP::Service> &service, const std::string &szAction) :
	m_service(service),
	m_action(szAction)
{
}


Samsung::UPnP::Results Samsung::ActionHandle::operator()(const UPnP::Arguments &args) const
{
	if (!m_service)
		throw std::logic_error("invoking unresolved action " + m_action);
	return m_service->Invoke(m_action, args);
}


/* ---------------------------------------------------------------------------------------------------------------- */


samsungCapabilities::samsungCapabilities() :
	m_snapshot(std::make_shared<Snapshot>()),
	m_generation(0)
{
}


/* private */ void samsungCapabilities::AddDevice(Snapshot &snapshot, const std::shared_ptr<Samsung::UPnP::Device> &device)
{
	if (!device)
		return;

	// the first device to claim a name keeps it
	snapshot.devices.insert(std::make_pair(device->GetName(), device));
	for (size_t i = 0; i < device->services.size(); i++)
	{
		if (device->services[i])
			snapshot.services.insert(std::make_pair(device->services[i]->GetName(), device->services[i]));
	}
	for (size_t i = 0; i < device->devices.size(); i++)
		AddDevice(snapshot, device->devices[i]);
}


/* private */ std::shared_ptr<const samsungCapabilities::Snapshot> samsungCapabilities::GetSnapshot() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_snapshot;
}


void samsungCapabilities::Rebuild(const std::vector<std::shared_ptr<Samsung::UPnP::Device> > &devices)
{
	std::shared_ptr<Snapshot> snapshot = std::make_shared<Snapshot>();
	for (size_t i = 0; i < devices.size(); i++)
		AddDevice(*snapshot, devices[i]);

	Samsung::Log::Debug("capability directory holds " + std::to_string(snapshot->services.size()) + " services");
	std::lock_guard<std::mutex> lock(m_mutex);
	m_snapshot = snapshot;
	m_generation++;
}


void samsungCapabilities::Clear()
{
	std::shared_ptr<const Snapshot> empty = std::make_shared<Snapshot>();
	std::lock_guard<std::mutex> lock(m_mutex);
	m_snapshot = empty;
	m_generation++;
}


bool samsungCapabilities::IsEmpty() const
{
	std::shared_ptr<const Snapshot> snapshot = GetSnapshot();
	return snapshot->services.empty() && snapshot->devices.empty();
}


unsigned int samsungCapabilities::GetGeneration() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_generation;
}


std::shared_ptr<Samsung::UPnP::Service> samsungCapabilities::GetService(const std::string &szName) const
{
	std::shared_ptr<const Snapshot> snapshot = GetSnapshot();
	std::map<std::string, std::shared_ptr<Samsung::UPnP::Service> >::const_iterator it = snapshot->services.find(szName);
	if (it == snapshot->services.end())
		return std::shared_ptr<Samsung::UPnP::Service>();
	return it->second;
}


std::shared_ptr<Samsung::UPnP::Device> samsungCapabilities::GetDevice(const std::string &szName) const
{
	std::shared_ptr<const Snapshot> snapshot = GetSnapshot();
	std::map<std::string, std::shared_ptr<Samsung::UPnP::Device> >::const_iterator it = snapshot->devices.find(szName);
	if (it == snapshot->devices.end())
		return std::shared_ptr<Samsung::UPnP::Device>();
	return it->second;
}


bool samsungCapabilities::HasService(const std::string &szName) const
{
	return (bool)GetService(szName);
}


bool samsungCapabilities::HasDevice(const std::string &szName) const
{
	return (bool)GetDevice(szName);
}


std::shared_ptr<Samsung::UPnP::Service> samsungCapabilities::operator[](const std::string &szName) const
{
	return GetService(szName);
}


std::vector<std::string> samsungCapabilities::GetServiceNames() const
{
	std::shared_ptr<const Snapshot> snapshot = GetSnapshot();
	std::vector<std::string> names;
	for (std::map<std::string, std::shared_ptr<Samsung::UPnP::Service> >::const_iterator it = snapshot->services.begin(); it != snapshot->services.end(); ++it)
		names.push_back(it->first);
	return names;
}


std::vector<std::string> samsungCapabilities::GetDeviceNames() const
{
	std::shared_ptr<const Snapshot> snapshot = GetSnapshot();
	std::vector<std::string> names;
	for (std::map<std::string, std::shared_ptr<Samsung::UPnP::Device> >::const_iterator it = snapshot->devices.begin(); it != snapshot->devices.end(); ++it)
		names.push_back(it->first);
	return names;
}


Samsung::ActionHandle samsungCapabilities::Resolve(const std::string &szService, const std::string &szAction) const
{
	std::shared_ptr<Samsung::UPnP::Service> service = GetService(szService);
	if ((!service) || (!service->HasAction(szAction)))
		return Samsung::ActionHandle();
	return Samsung::ActionHandle(service, szAction);
}
