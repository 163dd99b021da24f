/*
 *	Unit tests for the WebSocket remote base
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
#include "FakeServices.hpp"
#include "FakeServers.hpp"

#include <gtest/gtest.h>
#include <json/json.h>
#include <atomic>
#include <thread>

#define REMOTE_CONTROL_TARGET "/api/v2/channels/samsung.remote.control"


namespace {

class KeyRemote : public samsungWebSocket
{
public:
	KeyRemote(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery, const uint16_t port) :
		samsungWebSocket(config, discovery),
		m_port(port)
	{
	}

	~KeyRemote() override
	{
		StopLoop();
		ResetTransport();
	}

	bool Control(const std::string &szKey) override
	{
		Json::Value jCommand;
		jCommand["method"] = "ms.remote.control";
		jCommand["params"]["Cmd"] = "Click";
		jCommand["params"]["DataOfCmd"] = szKey;
		jCommand["params"]["Option"] = "false";
		jCommand["params"]["TypeOfRemote"] = "SendRemoteKey";

		Json::StreamWriterBuilder jWriter;
		jWriter["indentation"] = "";
		return Send(Json::writeString(jWriter, jCommand));
	}

protected:
	bool OpenTransport() override
	{
		return ConnectWebSocket(m_port, REMOTE_CONTROL_TARGET);
	}

private:
	uint16_t m_port;
};


class WebSocketTest : public ::testing::Test
{
protected:
	WebSocketTest() :
		discovery(std::make_shared<FakeDiscovery>()),
		info([](const FakeHttpServer::Request &, FakeHttpServer::Response &response)
		{
			response.set(http::field::content_type, "application/json");
			response.body() = "{\"device\": {\"OS\": \"Tizen\"}}";
		})
	{
		config.host = "127.0.0.1";
		std::vector<std::shared_ptr<Samsung::UPnP::Service> > services;
		services.push_back(std::make_shared<FakeService>("RenderingControl"));
		discovery->AddDevice(MakeDevice("MediaRenderer", services));

		remote.reset(new KeyRemote(config, discovery, server.GetPort()));
		remote->SetInfoPort(info.GetPort());
	}

	~WebSocketTest()
	{
		remote.reset();
	}

	bool IsOpen() const
	{
		return remote->GetState() == Samsung::Connection::State::OPEN;
	}

	Samsung::Config config;
	std::shared_ptr<FakeDiscovery> discovery;
	FakeWebSocketServer server;
	FakeHttpServer info;
	std::unique_ptr<KeyRemote> remote;
};

}; // namespace


TEST_F(WebSocketTest, StartConnectsToEndpoint)
{
	remote->Start();
	ASSERT_TRUE(WaitUntil([&]() { return IsOpen(); }, 3000));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetConnectionCount() == 1; }, 2000));
	EXPECT_EQ(REMOTE_CONTROL_TARGET, server.GetTarget());
	// the TV answered the power query, so its services were described
	EXPECT_EQ(1, discovery->GetCallCount());
	EXPECT_TRUE(remote->GetCapabilities().HasService("RenderingControl"));
	remote->Close();
}


TEST_F(WebSocketTest, ControlSendsText)
{
	remote->Start();
	ASSERT_TRUE(WaitUntil([&]() { return IsOpen(); }, 3000));

	EXPECT_TRUE(remote->Control("KEY_VOLUP"));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetReceived().size() == 1; }, 2000));

	Json::Value jMessage;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szMessage = server.GetReceived()[0];
	std::string szErrors;
	ASSERT_TRUE(jReader->parse(szMessage.c_str(), szMessage.c_str() + szMessage.size(), &jMessage, &szErrors));
	EXPECT_EQ("ms.remote.control", jMessage["method"].asString());
	EXPECT_EQ("KEY_VOLUP", jMessage["params"]["DataOfCmd"].asString());
	remote->Close();
}


TEST_F(WebSocketTest, PushedMessagesReachCallbacks)
{
	remote->Start();
	ASSERT_TRUE(WaitUntil([&]() { return IsOpen(); }, 3000));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetConnectionCount() == 1; }, 2000));

	std::mutex mutex;
	std::vector<std::string> messages;
	ASSERT_TRUE(remote->RegisterCallback([&](const std::string &szMessage)
	{
		std::lock_guard<std::mutex> lock(mutex);
		messages.push_back(szMessage);
	}, remote->GetEpoch()));
	EXPECT_EQ(1u, remote->GetCallbackCount());

	ASSERT_TRUE(server.Send("{\"event\": \"ms.channel.connect\"}"));
	ASSERT_TRUE(WaitUntil([&]()
	{
		std::lock_guard<std::mutex> lock(mutex);
		return messages.size() == 1;
	}, 2000));
	std::lock_guard<std::mutex> lock(mutex);
	EXPECT_EQ("{\"event\": \"ms.channel.connect\"}", messages[0]);
	remote->Close();
}


TEST_F(WebSocketTest, SendWhileReceiving)
{
	remote->Start();
	ASSERT_TRUE(WaitUntil([&]() { return IsOpen(); }, 3000));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetConnectionCount() == 1; }, 2000));

	std::atomic<int> messages(0);
	ASSERT_TRUE(remote->RegisterCallback([&](const std::string &) { messages++; }, remote->GetEpoch()));

	std::atomic<int> pushed(0);
	std::thread pusher([&]()
	{
		for (int i = 0; i < 50; i++)
		{
			if (server.Send("{\"event\": \"ms.channel.ready\"}"))
				pushed++;
		}
	});
	for (int i = 0; i < 50; i++)
		EXPECT_TRUE(remote->Control((i % 2) ? "KEY_VOLUP" : "KEY_VOLDOWN"));
	pusher.join();

	EXPECT_EQ(50, pushed.load());
	ASSERT_TRUE(WaitUntil([&]() { return server.GetReceived().size() == 50; }, 3000));
	ASSERT_TRUE(WaitUntil([&]() { return messages == 50; }, 3000));

	// commands arrive in the order they were given
	std::vector<std::string> received = server.GetReceived();
	for (size_t i = 0; i < received.size(); i++)
		EXPECT_NE(std::string::npos, received[i].find((i % 2) ? "KEY_VOLUP" : "KEY_VOLDOWN")) << "command " << i;
	EXPECT_TRUE(IsOpen());
	EXPECT_EQ(0u, remote->GetReconnectCount());
	remote->Close();
}


TEST_F(WebSocketTest, DropClearsCallbacksAndReconnects)
{
	remote->Start();
	ASSERT_TRUE(WaitUntil([&]() { return IsOpen(); }, 3000));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetConnectionCount() == 1; }, 2000));

	unsigned int epoch = remote->GetEpoch();
	ASSERT_TRUE(remote->RegisterCallback([](const std::string &) {}, epoch));

	server.DropClient();
	ASSERT_TRUE(WaitUntil([&]() { return (remote->GetReconnectCount() == 1) && IsOpen(); }, 5000));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetConnectionCount() == 2; }, 2000));

	EXPECT_EQ(0u, remote->GetCallbackCount());
	EXPECT_EQ(epoch + 1, remote->GetEpoch());
	// a handler meant for the lost connection is refused
	EXPECT_FALSE(remote->RegisterCallback([](const std::string &) {}, epoch));
	EXPECT_TRUE(remote->RegisterCallback([](const std::string &) {}, epoch + 1));
	EXPECT_EQ(1u, remote->GetLoopCount());

	EXPECT_TRUE(remote->Control("KEY_MUTE"));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetReceived().size() == 1; }, 2000));
	remote->Close();
}


TEST_F(WebSocketTest, CloseStopsTheLoop)
{
	remote->Start();
	ASSERT_TRUE(WaitUntil([&]() { return IsOpen(); }, 3000));

	remote->Close();
	EXPECT_FALSE(remote->IsRunning());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote->GetState());
	EXPECT_TRUE(remote->GetCapabilities().IsEmpty());
	EXPECT_FALSE(remote->Control("KEY_MUTE"));
	EXPECT_NO_THROW(remote->Close());
}


TEST_F(WebSocketTest, CloseWhileUnreachable)
{
	KeyRemote unreachable(config, discovery, UnusedPort());
	unreachable.Start();
	std::this_thread::sleep_for(std::chrono::milliseconds(100));
	EXPECT_NE(Samsung::Connection::State::OPEN, unreachable.GetState());
	EXPECT_TRUE(unreachable.IsRunning());

	EXPECT_NO_THROW(unreachable.Close());
	EXPECT_FALSE(unreachable.IsRunning());
	EXPECT_EQ(1u, unreachable.GetLoopCount());
}


TEST_F(WebSocketTest, CloseDuringStalledHandshake)
{
	// completes the TCP connection but never answers the upgrade request
	net::io_context ioc;
	tcp::acceptor silent(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));

	KeyRemote stalled(config, discovery, silent.local_endpoint().port());
	stalled.Start();
	EXPECT_TRUE(WaitUntil([&]() { return stalled.GetState() == Samsung::Connection::State::CONNECTING; }, 2000));
	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	EXPECT_EQ(Samsung::Connection::State::CONNECTING, stalled.GetState());

	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	EXPECT_NO_THROW(stalled.Close());
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(WEBSOCKET_JOIN_TIMEOUT_MSECS));
	EXPECT_FALSE(stalled.IsRunning());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, stalled.GetState());
	EXPECT_FALSE(stalled.Control("KEY_MUTE"));
}


TEST_F(WebSocketTest, PowerFromInfoEndpoint)
{
	EXPECT_TRUE(remote->GetPower());
	EXPECT_TRUE(remote->GetAttribute("power").value.asBool());

	remote->SetInfoPort(UnusedPort());
	EXPECT_FALSE(remote->GetPower());
}


TEST_F(WebSocketTest, MacAddressFromConfig)
{
	config.mac = "5c:49:7d:aa:bb:cc";
	EXPECT_EQ("5c:49:7d:aa:bb:cc", remote->GetMacAddress());
	EXPECT_EQ("5c:49:7d:aa:bb:cc", remote->GetAttribute("mac_address").value.asString());
}


TEST_F(WebSocketTest, ArtModeUnsupported)
{
	EXPECT_FALSE((bool)remote->GetArtMode());
	EXPECT_TRUE(remote->GetAttribute("art_mode").value.isNull());

	remote->SetAttribute("art_mode", Json::Value(true));
	EXPECT_TRUE(remote->GetAttribute("art_mode").value.isNull());
}
