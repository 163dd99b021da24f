/*
 *	Client interface for local Samsung TV access
 *
 *	Remote control for TVs built before 2014
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungLegacy.hpp"
#include "samsungPacket.hpp"
#include "samsungErrors.hpp"
#include "samsungLog.hpp"
#include <chrono>
#include <thread>


samsungLegacy::samsungLegacy(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery) :
	samsungSupervisor(config, discovery, LEGACY_RETRY_DELAY_MSECS, LEGACY_JOIN_TIMEOUT_MSECS),
	m_pairingState(Samsung::Legacy::Pairing::IDLE)
{
	RegisterProperty("power",
		[this]() { return Json::Value(GetPower()); },
		[this](const Json::Value &value) { SetPower(value.asBool()); });
	RegisterProperty("paired", [this]() { return Json::Value(m_config.paired); });
}


samsungLegacy::~samsungLegacy()
{
	StopLoop();
	ResetTransport();
}


Samsung::Legacy::Pairing::value samsungLegacy::GetPairingState() const
{
	return (Samsung::Legacy::Pairing::value)m_pairingState.load();
}


bool samsungLegacy::Open()
{
	if ((GetState() == Samsung::Connection::State::OPEN) && IsRunning())
		return true;
	if (!Establish())
		return false;
	return StartLoop(false);
}


bool samsungLegacy::OpenTransport()
{
	m_pairingState = Samsung::Legacy::Pairing::CONNECTING;

	uint16_t port = (m_config.port > 0) ? m_config.port : SAMSUNG_LEGACY_PORT;
	int timeout = (m_config.timeout > 0) ? m_config.timeout * 1000 : LEGACY_CONNECT_TIMEOUT_MSECS;

	bool connected;
	{
		std::lock_guard<std::mutex> lock(m_sendMutex);
		connected = m_socket.ConnectToDevice(m_config.host, port, timeout, [this]() { return IsStopRequested(); });
	}
	if (connected)
		return true;

	m_pairingState = Samsung::Legacy::Pairing::IDLE;
	if (IsStopRequested())
		return false;
	if (!m_config.paired)
		throw Samsung::ConnectionRefused(m_config.host);

	Samsung::Log::Info("unable to connect to TV at " + m_config.host + ", is the TV on?");
	return false;
}


bool samsungLegacy::Authenticate()
{
	std::string szHandshake = samsungPacket::BuildHandshake(m_config.description, m_config.id, m_config.name);
#ifdef DEBUG
	Samsung::Log::Debug("sending handshake: " + Samsung::Log::Hex(szHandshake));
#endif
	{
		std::lock_guard<std::mutex> lock(m_sendMutex);
		if (m_socket.send(szHandshake) < 0)
		{
			Samsung::Log::Warning("failed to send handshake to " + m_config.host);
			m_pairingState = Samsung::Legacy::Pairing::IDLE;
			return false;
		}
	}
	m_pairingState = Samsung::Legacy::Pairing::AWAITING_AUTH;

	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	bool waiting = false;
	while (true)
	{
		if (IsStopRequested())
		{
			m_pairingState = Samsung::Legacy::Pairing::IDLE;
			return false;
		}
		if ((m_config.pairing_timeout > 0) && (std::chrono::steady_clock::now() - start > std::chrono::seconds(m_config.pairing_timeout)))
		{
			Samsung::Log::Warning("pairing request was not confirmed on the TV in time");
			m_pairingState = Samsung::Legacy::Pairing::IDLE;
			return false;
		}

		if (!m_socket.isSocketReadable(LEGACY_POLL_MSECS))
		{
			if (!m_socket.isConnected())
			{
				m_pairingState = Samsung::Legacy::Pairing::IDLE;
				throw Samsung::ConnectionClosed();
			}
			continue;
		}

		std::string szDeviceName;
		std::string szResponse;
		try
		{
			szResponse = samsungPacket::ReadFrame(m_socket, szDeviceName, LEGACY_READ_TIMEOUT_MSECS);
		}
		catch (const Samsung::ConnectionClosed &)
		{
			m_pairingState = Samsung::Legacy::Pairing::IDLE;
			throw;
		}

		switch (samsungPacket::Classify(szResponse))
		{
			case Samsung::Legacy::Response::GRANTED:
				Samsung::Log::Debug("access granted by '" + szDeviceName + "'");
				m_config.paired = true;
				m_pairingState = Samsung::Legacy::Pairing::PAIRED;
				return true;
			case Samsung::Legacy::Response::ACCEPTED:
				m_pairingState = Samsung::Legacy::Pairing::PAIRED;
				return true;
			case Samsung::Legacy::Response::DENIED:
				m_pairingState = Samsung::Legacy::Pairing::DENIED;
				throw Samsung::AccessDenied();
			case Samsung::Legacy::Response::CANCELLED:
				Samsung::Log::Warning("pairing request was cancelled on the TV");
				m_pairingState = Samsung::Legacy::Pairing::CANCELLED;
				throw Samsung::AccessDenied();
			case Samsung::Legacy::Response::WAITING:
				if (!waiting)
					Samsung::Log::Warning("please accept the connection on the TV");
				waiting = true;
				break;
			default:
				m_pairingState = Samsung::Legacy::Pairing::IDLE;
				throw Samsung::UnhandledResponse(szResponse);
		}
	}
}


Samsung::Connection::Receive::value samsungLegacy::Receive(std::string &szFrame)
{
	if (!m_socket.isConnected())
		return Samsung::Connection::Receive::CLOSED;

	if (!m_socket.isSocketReadable(LEGACY_POLL_MSECS))
	{
		if (m_socket.isConnected())
			return Samsung::Connection::Receive::TIMEOUT;
		return Samsung::Connection::Receive::CLOSED;
	}

	std::string szDeviceName;
	try
	{
		szFrame = samsungPacket::ReadFrame(m_socket, szDeviceName, LEGACY_READ_TIMEOUT_MSECS);
	}
	catch (const Samsung::ConnectionClosed &)
	{
		return Samsung::Connection::Receive::CLOSED;
	}
	return Samsung::Connection::Receive::DATA;
}


void samsungLegacy::OnMessage(const std::string &szFrame)
{
	switch (samsungPacket::Classify(szFrame))
	{
		case Samsung::Legacy::Response::ACCEPTED:
			Samsung::Log::Debug("control accepted");
			break;
		case Samsung::Legacy::Response::GRANTED:
			Samsung::Log::Debug("access granted");
			break;
		case Samsung::Legacy::Response::DENIED:
			Samsung::Log::Warning("access denied by TV");
			break;
		default:
			Samsung::Log::Debug("unhandled frame: " + Samsung::Log::Hex(szFrame));
			break;
	}
}


void samsungLegacy::OnDisconnect()
{
	m_pairingState = Samsung::Legacy::Pairing::IDLE;
}


void samsungLegacy::ResetTransport()
{
	std::lock_guard<std::mutex> lock(m_sendMutex);
	m_socket.disconnect();
}


bool samsungLegacy::Control(const std::string &szKey)
{
	std::lock_guard<std::mutex> lock(m_sendMutex);
	if ((GetState() != Samsung::Connection::State::OPEN) || !m_socket.isConnected())
	{
		Samsung::Log::Warning("unable to send " + szKey + ", the TV at " + m_config.host + " is not connected");
		return false;
	}

	Samsung::Log::Info("sending control command: " + szKey);
	if (m_socket.send(samsungPacket::BuildControl(szKey)) < 0)
	{
		Samsung::Log::Warning("failed to send " + szKey + " to " + m_config.host);
		return false;
	}
	std::this_thread::sleep_for(std::chrono::milliseconds(LEGACY_KEY_INTERVAL_MSECS));
	return true;
}


bool samsungLegacy::GetPower()
{
	std::lock_guard<std::mutex> lock(m_sendMutex);
	return m_socket.isConnected();
}


void samsungLegacy::SetPower(const bool power)
{
	if (power)
	{
		Samsung::Log::Info("power on is not supported by the legacy remote");
		return;
	}

	while (GetPower())
	{
		if (!Control("KEY_POWEROFF"))
			break;
		if (WaitFor(LEGACY_POWEROFF_INTERVAL_MSECS))
			break;
	}
}
