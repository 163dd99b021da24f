/*
 *	Client interface for local Samsung TV access
 *
 *	Base class for remotes of 2014+ TVs that talk over a WebSocket
 *
 *	Derived classes implement OpenTransport(), normally by calling
 *	ConnectWebSocket() with the endpoint of their protocol, and Control().
 *
 *	The stream belongs to the loop thread. Send() hands the message to the
 *	loop, which writes queued messages in order between reads.
 *
 *	Common functions:
 *	 - Start()
 *		Starts the background loop, which connects to the TV and keeps
 *		retrying every second until it succeeds or the remote is closed
 *	 - RegisterCallback(callback, epoch)
 *		Adds a handler for inbound messages of the current connection.
 *		All handlers are dropped when the connection is lost, a handler for
 *		an older connection (epoch) is refused.
 *	 - GetPower()
 *		Queries the device info endpoint, any answer means the TV is on
 *	 - GetMacAddress()
 *		Looks up the MAC address in the ARP table once and stores it in the
 *		configuration
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungWebSocket
#define _samsungWebSocket

#define WEBSOCKET_RETRY_DELAY_MSECS 1000
#define WEBSOCKET_JOIN_TIMEOUT_MSECS 3000
#define WEBSOCKET_CONNECT_TIMEOUT_MSECS 5000
#define WEBSOCKET_POLL_MSECS 200

#include "samsungSupervisor.hpp"
#include <boost/optional.hpp>
#include <functional>
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <cstdint>


class samsungWebSocket : public samsungSupervisor
{
public:
	typedef std::function<void(const std::string&)> Callback;

	samsungWebSocket(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery = nullptr);
	~samsungWebSocket() override;

	void Start();

	virtual bool Control(const std::string &szKey) = 0;

	bool GetPower() override;
	std::string GetMacAddress();

	boost::optional<bool> GetArtMode() const;
	void SetArtMode(const bool enable);

	unsigned int GetEpoch() const;
	bool RegisterCallback(const Callback &callback, const unsigned int epoch);
	size_t GetCallbackCount() const;

protected:
	bool ConnectWebSocket(const uint16_t port, const std::string &szTarget);
	// queues the message for the loop thread, returns false if not connected
	bool Send(const std::string &szMessage);

	Samsung::Connection::Receive::value Receive(std::string &szFrame) override;
	void OnMessage(const std::string &szFrame) override;
	void OnDisconnect() override;
	void InterruptReceive() override;
	void ResetTransport() override;

private:
	struct Connection;

	std::shared_ptr<Connection> GetConnection() const;

	mutable std::mutex m_streamMutex;
	std::shared_ptr<Connection> m_connection;

	mutable std::mutex m_callbackMutex;
	std::vector<Callback> m_callbacks;
	unsigned int m_epoch;

	std::mutex m_macMutex;
};

#endif // _samsungWebSocket
