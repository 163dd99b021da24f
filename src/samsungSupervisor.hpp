/*
 *	Client interface for local Samsung TV access
 *
 *	Connection supervisor shared by the remote transports
 *
 *	Runs a single background thread per remote that receives frames from
 *	the TV and reconnects when the connection drops. Transports implement
 *	the hooks below, all of which are called from the loop thread except
 *	where noted.
 *
 *	 - OpenTransport()
 *		Establish the connection. Return false if the TV can not be reached
 *		right now, throw on errors that retrying will not fix.
 *	 - Authenticate()
 *		Complete the protocol handshake on the opened connection.
 *		OpenTransport() and Authenticate() always run together under the
 *		authentication mutex, also when invoked from a caller thread.
 *	 - Receive(frame)
 *		Wait for the next frame. Must return within a bounded time or when
 *		InterruptReceive() is called.
 *	 - OnMessage(frame) / OnDisconnect()
 *		Notifications, the capability directory is already cleared when
 *		OnDisconnect() is called.
 *	 - InterruptReceive()
 *		Called from the thread that closes the remote.
 *	 - ResetTransport()
 *		Release the connection.
 *
 *	Close() stops the loop and waits for it a bounded time. A connection
 *	attempt running on a caller thread sees the stop request and gives up,
 *	Close() waits for that as well before the transport is released. It
 *	throws Samsung::ShutdownTimeout if either failed to terminate, in which
 *	case the final join happens on destruction. Closing a remote that is
 *	not running does nothing.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungSupervisor
#define _samsungSupervisor

#include "samsungTV.hpp"
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>


namespace Samsung {
  namespace Connection {
    namespace State {
      enum value {
        DISCONNECTED,
        CONNECTING,
        AUTHENTICATING,
        OPEN,
        CLOSING
      }; // enum value
    }; // namespace State

    namespace Receive {
      enum value {
        DATA,
        TIMEOUT,
        CLOSED
      }; // enum value
    }; // namespace Receive
  }; // namespace Connection
}; // namespace Samsung


class samsungSupervisor : public samsungTV
{
public:
	samsungSupervisor(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery, const int retryDelay, const int joinTimeout);
	virtual ~samsungSupervisor();

	Samsung::Connection::State::value GetState() const;
	// true while the loop thread runs
	bool IsRunning() const;

	// loop threads started since construction
	unsigned int GetLoopCount() const;
	// highest number of loop threads that ever ran at the same time
	unsigned int GetPeakLoops() const;
	// connection drops handled by the loop
	unsigned int GetReconnectCount() const;

	// throws Samsung::ShutdownTimeout
	void Close();

protected:
	virtual bool OpenTransport() = 0;
	virtual bool Authenticate() { return true; }
	virtual Samsung::Connection::Receive::value Receive(std::string &szFrame) = 0;
	virtual void OnMessage(const std::string &szFrame) { (void)szFrame; }
	virtual void OnDisconnect() {}
	virtual void InterruptReceive() {}
	virtual void ResetTransport() = 0;

	// open and authenticate under the authentication mutex, no-op when already open
	// returns false when the remote is being closed
	bool Establish();
	// start the loop thread unless it is already running
	// without `establish` the connection must be open, returns false if it was closed meanwhile
	bool StartLoop(const bool establish);
	// stop and join the loop without time limit, for use in destructors of derived classes
	void StopLoop();

	bool IsStopRequested() const { return m_stopRequested; }
	// returns true if a stop was requested before `timeout` milliseconds passed
	bool WaitFor(const int timeout);

	void SetState(const Samsung::Connection::State::value state);

private:
	void Loop(const bool establish);
	bool TryEstablish();
	void HandleDisconnect();

	std::thread m_thread;
	std::atomic<bool> m_stopRequested;
	std::atomic<bool> m_running;
	std::atomic<unsigned int> m_activeLoops;
	std::atomic<unsigned int> m_peakLoops;
	std::atomic<unsigned int> m_loopCount;
	std::atomic<unsigned int> m_reconnectCount;

	std::timed_mutex m_authMutex;
	std::mutex m_closeMutex;
	mutable std::mutex m_stateMutex;
	std::condition_variable m_stateCondition;
	Samsung::Connection::State::value m_state;

	int m_retryDelay;
	int m_joinTimeout;
};

#endif // _samsungSupervisor
