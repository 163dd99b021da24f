/*
 *	Client interface for local Samsung TV access
 *
 *	Base class for remotes of 2014+ TVs that talk over a WebSocket
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungWebSocket.hpp"
#include "samsungHTTP.hpp"
#include "samsungWOL.hpp"
#include "samsungLog.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <deque>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;


// all members are used by the thread that runs `ioc`
struct samsungWebSocket::Connection
{
	net::io_context ioc;
	websocket::stream<beast::tcp_stream> ws;
	beast::flat_buffer buffer;
	bool reading;
	bool received;
	beast::error_code readError;
	std::deque<std::string> outbox;
	beast::error_code writeError;

	Connection() : ws(ioc), reading(false), received(false) {}

	void Write(const std::string &szMessage)
	{
		outbox.push_back(szMessage);
		if (outbox.size() == 1)
			WriteNext();
	}

	void WriteNext()
	{
		ws.async_write(net::buffer(outbox.front()), [this](beast::error_code ec, size_t)
		{
			if (ec)
			{
				writeError = ec;
				outbox.clear();
				return;
			}
			outbox.pop_front();
			if (!outbox.empty())
				WriteNext();
		});
	}
};


samsungWebSocket::samsungWebSocket(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery) :
	samsungSupervisor(config, discovery, WEBSOCKET_RETRY_DELAY_MSECS, WEBSOCKET_JOIN_TIMEOUT_MSECS),
	m_epoch(0)
{
	RegisterProperty("power", [this]() { return Json::Value(GetPower()); });
	RegisterProperty("mac_address", [this]() { return Json::Value(GetMacAddress()); });
	RegisterProperty("art_mode",
		[this]() {
			boost::optional<bool> artmode = GetArtMode();
			return artmode ? Json::Value(*artmode) : Json::Value();
		},
		[this](const Json::Value &value) { SetArtMode(value.asBool()); });
}


samsungWebSocket::~samsungWebSocket()
{
	StopLoop();
	ResetTransport();
}


void samsungWebSocket::Start()
{
	StartLoop(true);
}


/* private */ std::shared_ptr<samsungWebSocket::Connection> samsungWebSocket::GetConnection() const
{
	std::lock_guard<std::mutex> lock(m_streamMutex);
	return m_connection;
}


bool samsungWebSocket::ConnectWebSocket(const uint16_t port, const std::string &szTarget)
{
	std::shared_ptr<Connection> connection = std::make_shared<Connection>();
	tcp::resolver resolver(connection->ioc);
	beast::error_code ec;

	tcp::resolver::results_type results = resolver.resolve(m_config.host, std::to_string(port), ec);
	if (ec)
	{
		Samsung::Log::Debug("unable to resolve " + m_config.host + ": " + ec.message());
		return false;
	}

	connection->ws.set_option(websocket::stream_base::decorator([](websocket::request_type &req)
	{
		req.set(http::field::user_agent, SAMSUNG_USER_AGENT);
	}));

	std::string szHost = m_config.host + ":" + std::to_string(port);
	int timeout = (m_config.timeout > 0) ? m_config.timeout * 1000 : WEBSOCKET_CONNECT_TIMEOUT_MSECS;
	bool finished = false;
	bool complete = false;

	// the expiry covers connect and handshake together
	beast::get_lowest_layer(connection->ws).expires_after(std::chrono::milliseconds(timeout));
	beast::get_lowest_layer(connection->ws).async_connect(results, [&](beast::error_code connect_ec, const tcp::endpoint &)
	{
		if (connect_ec)
		{
			ec = connect_ec;
			finished = true;
			return;
		}
		connection->ws.async_handshake(szHost, szTarget, [&](beast::error_code handshake_ec)
		{
			ec = handshake_ec;
			complete = !handshake_ec;
			finished = true;
		});
	});

	// run in slices so that a stop request ends a stalled handshake
	while (!finished)
	{
		if (IsStopRequested())
		{
			beast::get_lowest_layer(connection->ws).close();
			connection->ioc.restart();
			connection->ioc.run_for(std::chrono::milliseconds(WEBSOCKET_POLL_MSECS));
			Samsung::Log::Debug("websocket connection to " + szHost + szTarget + " aborted");
			return false;
		}
		if (connection->ioc.stopped())
			connection->ioc.restart();
		connection->ioc.run_for(std::chrono::milliseconds(WEBSOCKET_POLL_MSECS));
	}

	if (!complete)
	{
		Samsung::Log::Debug("websocket connection to " + szHost + szTarget + " failed: " + ec.message());
		return false;
	}

	// reads wait until a frame arrives, Receive() polls them
	beast::get_lowest_layer(connection->ws).expires_never();
	connection->ws.text(true);
	connection->ioc.restart();

	std::lock_guard<std::mutex> lock(m_streamMutex);
	m_connection = connection;
	return true;
}


bool samsungWebSocket::Send(const std::string &szMessage)
{
	std::shared_ptr<Connection> connection = GetConnection();
	if (!connection)
	{
		Samsung::Log::Warning("unable to send to " + m_config.host + ", not connected");
		return false;
	}

	Connection *target = connection.get();
	net::post(connection->ioc, [target, szMessage]() { target->Write(szMessage); });
	return true;
}


Samsung::Connection::Receive::value samsungWebSocket::Receive(std::string &szFrame)
{
	std::shared_ptr<Connection> connection = GetConnection();
	if (!connection)
		return Samsung::Connection::Receive::CLOSED;

	if (!connection->reading)
	{
		Connection *target = connection.get();
		connection->reading = true;
		connection->ws.async_read(connection->buffer, [target](beast::error_code ec, size_t)
		{
			target->readError = ec;
			target->received = true;
		});
	}

	// queued writes run here as well
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(WEBSOCKET_POLL_MSECS);
	while ((!connection->received) && (!connection->writeError) && (!IsStopRequested()))
	{
		if (connection->ioc.stopped())
			connection->ioc.restart();
		if (connection->ioc.run_one_until(deadline) == 0)
			break;
	}

	if (connection->writeError)
	{
		Samsung::Log::Warning("failed to send to " + m_config.host + ": " + connection->writeError.message());
		return Samsung::Connection::Receive::CLOSED;
	}
	if (!connection->received)
		return Samsung::Connection::Receive::TIMEOUT;

	connection->reading = false;
	connection->received = false;
	if (connection->readError)
	{
		Samsung::Log::Debug("websocket read from " + m_config.host + " ended: " + connection->readError.message());
		return Samsung::Connection::Receive::CLOSED;
	}

	szFrame = beast::buffers_to_string(connection->buffer.data());
	connection->buffer.consume(connection->buffer.size());
	if (szFrame.empty())
		return Samsung::Connection::Receive::CLOSED;
	return Samsung::Connection::Receive::DATA;
}


void samsungWebSocket::OnMessage(const std::string &szFrame)
{
	std::vector<Callback> callbacks;
	{
		std::lock_guard<std::mutex> lock(m_callbackMutex);
		callbacks = m_callbacks;
	}
	for (size_t i = 0; i < callbacks.size(); i++)
		callbacks[i](szFrame);
}


void samsungWebSocket::OnDisconnect()
{
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	m_callbacks.clear();
	m_epoch++;
}


void samsungWebSocket::InterruptReceive()
{
	std::lock_guard<std::mutex> lock(m_streamMutex);
	if (m_connection)
		m_connection->ioc.stop();
}


void samsungWebSocket::ResetTransport()
{
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_streamMutex);
		connection.swap(m_connection);
	}
	if (!connection)
		return;

	beast::error_code ec;
	beast::get_lowest_layer(connection->ws).socket().close(ec);
}


unsigned int samsungWebSocket::GetEpoch() const
{
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	return m_epoch;
}


bool samsungWebSocket::RegisterCallback(const Callback &callback, const unsigned int epoch)
{
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	if (epoch != m_epoch)
	{
		Samsung::Log::Debug("refused callback for an earlier connection");
		return false;
	}
	m_callbacks.push_back(callback);
	return true;
}


size_t samsungWebSocket::GetCallbackCount() const
{
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	return m_callbacks.size();
}


bool samsungWebSocket::GetPower()
{
	Samsung::HTTP::Response response;
	return Samsung::HTTP::Get(GetInfoUrl(), SAMSUNG_INFO_TIMEOUT_MSECS, response);
}


std::string samsungWebSocket::GetMacAddress()
{
	std::lock_guard<std::mutex> lock(m_macMutex);
	if (m_config.mac.empty())
	{
		m_config.mac = Samsung::WOL::GetMacAddress(m_config.host);
		if (m_config.mac.empty() && !GetPower())
			Samsung::Log::Error("unable to acquire the MAC address of " + m_config.host + ", the TV needs to be on");
	}
	return m_config.mac;
}


boost::optional<bool> samsungWebSocket::GetArtMode() const
{
	return boost::none;
}


void samsungWebSocket::SetArtMode(const bool enable)
{
	(void)enable;
}
