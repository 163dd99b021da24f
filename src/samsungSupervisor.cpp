/*
 *	Client interface for local Samsung TV access
 *
 *	Connection supervisor shared by the remote transports
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungSupervisor.hpp"
#include "samsungErrors.hpp"
#include "samsungLog.hpp"
#include <chrono>


samsungSupervisor::samsungSupervisor(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery, const int retryDelay, const int joinTimeout) :
	samsungTV(config, discovery),
	m_stopRequested(false),
	m_running(false),
	m_activeLoops(0),
	m_peakLoops(0),
	m_loopCount(0),
	m_reconnectCount(0),
	m_state(Samsung::Connection::State::DISCONNECTED),
	m_retryDelay(retryDelay),
	m_joinTimeout(joinTimeout)
{
}


samsungSupervisor::~samsungSupervisor()
{
	// derived classes stop the loop before their hooks go away, this only catches a timed out Close()
	m_stopRequested = true;
	m_stateCondition.notify_all();
	if (m_thread.joinable())
		m_thread.join();
}


Samsung::Connection::State::value samsungSupervisor::GetState() const
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_state;
}


void samsungSupervisor::SetState(const Samsung::Connection::State::value state)
{
	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_state = state;
}


bool samsungSupervisor::IsRunning() const
{
	return m_running;
}


unsigned int samsungSupervisor::GetLoopCount() const
{
	return m_loopCount;
}


unsigned int samsungSupervisor::GetPeakLoops() const
{
	return m_peakLoops;
}


unsigned int samsungSupervisor::GetReconnectCount() const
{
	return m_reconnectCount;
}


bool samsungSupervisor::WaitFor(const int timeout)
{
	std::unique_lock<std::mutex> lock(m_stateMutex);
	return m_stateCondition.wait_for(lock, std::chrono::milliseconds(timeout), [this]() { return (bool)m_stopRequested; });
}


bool samsungSupervisor::Establish()
{
	std::lock_guard<std::timed_mutex> lock(m_authMutex);
	if (GetState() == Samsung::Connection::State::OPEN)
		return true;
	if (IsStopRequested())
		return false;

	try
	{
		SetState(Samsung::Connection::State::CONNECTING);
		if (!OpenTransport())
		{
			SetState(Samsung::Connection::State::DISCONNECTED);
			return false;
		}

		SetState(Samsung::Connection::State::AUTHENTICATING);
		if (!Authenticate() || IsStopRequested())
		{
			ResetTransport();
			SetState(Samsung::Connection::State::DISCONNECTED);
			return false;
		}
	}
	catch (const std::exception &)
	{
		ResetTransport();
		SetState(Samsung::Connection::State::DISCONNECTED);
		throw;
	}

	SetState(Samsung::Connection::State::OPEN);
	Samsung::Log::Info("connected to TV at " + m_config.host);
	Connect();
	return true;
}


/* private */ bool samsungSupervisor::TryEstablish()
{
	try
	{
		return Establish();
	}
	catch (const std::exception &e)
	{
		Samsung::Log::Warning("reconnect to " + m_config.host + " failed: " + e.what());
	}
	return false;
}


/* private */ void samsungSupervisor::HandleDisconnect()
{
	// not while a caller thread sets up a new connection
	std::lock_guard<std::timed_mutex> lock(m_authMutex);
	Samsung::Log::Info("lost connection with TV at " + m_config.host);
	m_reconnectCount++;
	SetState(Samsung::Connection::State::DISCONNECTED);
	ResetTransport();
	Disconnect();
	OnDisconnect();
}


/* private */ void samsungSupervisor::Loop(const bool establish)
{
	unsigned int active = ++m_activeLoops;
	unsigned int peak = m_peakLoops;
	while ((active > peak) && !m_peakLoops.compare_exchange_weak(peak, active))
		;

	if (establish && !IsStopRequested())
		TryEstablish();

	while (!IsStopRequested())
	{
		if (GetState() != Samsung::Connection::State::OPEN)
		{
			if (!TryEstablish())
				WaitFor(m_retryDelay);
			continue;
		}

		std::string szFrame;
		Samsung::Connection::Receive::value result = Receive(szFrame);
		if (IsStopRequested())
			break;

		if (result == Samsung::Connection::Receive::DATA)
		{
			try
			{
				OnMessage(szFrame);
			}
			catch (const std::exception &e)
			{
				Samsung::Log::Error(std::string("failed to process message: ") + e.what());
			}
		}
		else if (result == Samsung::Connection::Receive::CLOSED)
			HandleDisconnect();
	}

	m_activeLoops--;
	std::lock_guard<std::mutex> lock(m_stateMutex);
	m_running = false;
	m_stateCondition.notify_all();
}


bool samsungSupervisor::StartLoop(const bool establish)
{
	std::lock_guard<std::mutex> lock(m_closeMutex);
	if (m_running)
		return true;
	if (!establish && (GetState() != Samsung::Connection::State::OPEN))
		return false;
	// a loop that ended on its own still needs to be joined
	if (m_thread.joinable())
		m_thread.join();

	m_stopRequested = false;
	m_running = true;
	m_loopCount++;
	m_thread = std::thread(&samsungSupervisor::Loop, this, establish);
	return true;
}


void samsungSupervisor::StopLoop()
{
	std::lock_guard<std::mutex> lock(m_closeMutex);
	{
		std::lock_guard<std::mutex> statelock(m_stateMutex);
		m_stopRequested = true;
		m_stateCondition.notify_all();
	}
	InterruptReceive();
	if (m_thread.joinable())
		m_thread.join();
	m_stopRequested = false;
}


void samsungSupervisor::Close()
{
	std::lock_guard<std::mutex> lock(m_closeMutex);
	if ((!m_thread.joinable()) && (GetState() == Samsung::Connection::State::DISCONNECTED))
		return;

	{
		std::lock_guard<std::mutex> statelock(m_stateMutex);
		m_stopRequested = true;
		m_state = Samsung::Connection::State::CLOSING;
		m_stateCondition.notify_all();
	}
	InterruptReceive();

	if (m_thread.joinable())
	{
		std::unique_lock<std::mutex> statelock(m_stateMutex);
		if (!m_stateCondition.wait_for(statelock, std::chrono::milliseconds(m_joinTimeout), [this]() { return !m_running; }))
		{
			Samsung::Log::Error("loop thread for " + m_config.host + " did not terminate");
			throw Samsung::ShutdownTimeout();
		}
		statelock.unlock();
		m_thread.join();
	}

	// Open() on another thread may still be connecting or pairing
	std::unique_lock<std::timed_mutex> authlock(m_authMutex, std::chrono::milliseconds(m_joinTimeout));
	if (!authlock.owns_lock())
	{
		Samsung::Log::Error("connection attempt to " + m_config.host + " did not terminate");
		throw Samsung::ShutdownTimeout();
	}

	ResetTransport();
	SetState(Samsung::Connection::State::DISCONNECTED);
	m_stopRequested = false;
	Disconnect();
	Samsung::Log::Debug("connection with " + m_config.host + " closed");
}
