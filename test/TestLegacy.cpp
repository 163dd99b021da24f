/*
 *	Unit tests for the legacy remote against a scripted TV
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
#include "FakeServices.hpp"
#include "FakeServers.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>


namespace {

class LegacyTest : public ::testing::Test
{
protected:
	LegacyTest() :
		discovery(std::make_shared<FakeDiscovery>())
	{
		config.host = "127.0.0.1";
		config.name = "unittest";
		config.description = "PC";
		config.id = "unittest-id";
	}

	Samsung::Config config;
	std::shared_ptr<FakeDiscovery> discovery;
};

}; // namespace


TEST_F(LegacyTest, PairsAfterWaiting)
{
	FakeLegacyTV server({FakeLegacyTV::Waiting(), FakeLegacyTV::Granted()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	ASSERT_TRUE(remote.Open());
	EXPECT_TRUE(config.paired);
	EXPECT_EQ(Samsung::Legacy::Pairing::PAIRED, remote.GetPairingState());
	EXPECT_EQ(Samsung::Connection::State::OPEN, remote.GetState());
	EXPECT_TRUE(remote.IsRunning());
	EXPECT_TRUE(remote.GetPower());
	EXPECT_EQ(1, discovery->GetCallCount());
	EXPECT_TRUE(remote.GetAttribute("paired").value.asBool());

	ASSERT_TRUE(WaitUntil([&]() { return !server.GetHandshake().empty(); }, 2000));
	EXPECT_EQ(samsungPacket::BuildHandshake("PC", "unittest-id", "unittest"), server.GetHandshake());

	// opening again reuses the connection
	EXPECT_TRUE(remote.Open());
	EXPECT_EQ(1u, server.GetConnectionCount());
	remote.Close();
}


TEST_F(LegacyTest, ControlKeysArriveInOrder)
{
	FakeLegacyTV server({FakeLegacyTV::Granted()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	ASSERT_TRUE(remote.Open());

	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	EXPECT_TRUE(remote.Control("KEY_VOLUP"));
	EXPECT_TRUE(remote.Control("KEY_VOLDOWN"));
	EXPECT_TRUE(remote.Control("KEY_MUTE"));
	EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(3 * LEGACY_KEY_INTERVAL_MSECS));

	ASSERT_TRUE(WaitUntil([&]() { return server.GetKeys().size() == 3; }, 2000));
	std::vector<std::string> keys = server.GetKeys();
	EXPECT_EQ("KEY_VOLUP", keys[0]);
	EXPECT_EQ("KEY_VOLDOWN", keys[1]);
	EXPECT_EQ("KEY_MUTE", keys[2]);

	// spacing as seen by the TV, less wake-up jitter of the fake TV thread
	std::vector<std::chrono::steady_clock::time_point> arrivals = server.GetKeyTimes();
	ASSERT_EQ(3u, arrivals.size());
	for (size_t i = 1; i < arrivals.size(); i++)
		EXPECT_GE(arrivals[i] - arrivals[i - 1], std::chrono::milliseconds(LEGACY_KEY_INTERVAL_MSECS - 5)) << "between key " << i - 1 << " and " << i;
	remote.Close();
}


TEST_F(LegacyTest, AcceptedHandshakeKeepsPairingFlag)
{
	FakeLegacyTV server({FakeLegacyTV::Accepted()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	ASSERT_TRUE(remote.Open());
	EXPECT_FALSE(config.paired);
	EXPECT_EQ(Samsung::Legacy::Pairing::PAIRED, remote.GetPairingState());
	remote.Close();
}


TEST_F(LegacyTest, AccessDenied)
{
	FakeLegacyTV server({FakeLegacyTV::Denied()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	EXPECT_THROW(remote.Open(), Samsung::AccessDenied);
	EXPECT_FALSE(config.paired);
	EXPECT_EQ(Samsung::Legacy::Pairing::DENIED, remote.GetPairingState());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote.GetState());
	EXPECT_FALSE(remote.IsRunning());
	EXPECT_FALSE(remote.GetPower());
	EXPECT_EQ(0, discovery->GetCallCount());
}


TEST_F(LegacyTest, PairingCancelled)
{
	FakeLegacyTV server({FakeLegacyTV::Waiting(), FakeLegacyTV::Cancelled()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	EXPECT_THROW(remote.Open(), Samsung::AccessDenied);
	EXPECT_EQ(Samsung::Legacy::Pairing::CANCELLED, remote.GetPairingState());
	EXPECT_FALSE(config.paired);
}


TEST_F(LegacyTest, CloseWhilePairing)
{
	FakeLegacyTV server({FakeLegacyTV::Waiting()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	std::atomic<int> opened(-1);
	std::thread opener([&]()
	{
		try
		{
			opened = remote.Open() ? 1 : 0;
		}
		catch (const Samsung::Error &e)
		{
			ADD_FAILURE() << "Open() threw: " << e.what();
			opened = 2;
		}
	});

	EXPECT_TRUE(WaitUntil([&]() { return remote.GetPairingState() == Samsung::Legacy::Pairing::AWAITING_AUTH; }, 2000));
	std::this_thread::sleep_for(std::chrono::milliseconds(300));
	EXPECT_EQ(Samsung::Connection::State::AUTHENTICATING, remote.GetState());

	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	EXPECT_NO_THROW(remote.Close());
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(LEGACY_JOIN_TIMEOUT_MSECS));
	opener.join();

	// the pending request is withdrawn
	EXPECT_EQ(0, opened.load());
	EXPECT_EQ(Samsung::Legacy::Pairing::IDLE, remote.GetPairingState());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote.GetState());
	EXPECT_FALSE(remote.IsRunning());
	EXPECT_FALSE(remote.GetPower());
	EXPECT_FALSE(config.paired);
	EXPECT_EQ(0, discovery->GetCallCount());
	EXPECT_EQ(1u, server.GetConnectionCount());
}


TEST_F(LegacyTest, UnhandledResponseCarriesRawBytes)
{
	const std::string szResponse("\x64\x00\x02\x00", 4);
	FakeLegacyTV server({FakeLegacyTV::Frame(szResponse)});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	try
	{
		remote.Open();
		FAIL() << "expected Samsung::UnhandledResponse";
	}
	catch (const Samsung::UnhandledResponse &e)
	{
		EXPECT_EQ(szResponse, e.raw());
	}
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote.GetState());
}


TEST_F(LegacyTest, RefusedBeforePairing)
{
	config.port = UnusedPort();
	samsungLegacy remote(config, discovery);
	EXPECT_THROW(remote.Open(), Samsung::ConnectionRefused);
	EXPECT_EQ(Samsung::Legacy::Pairing::IDLE, remote.GetPairingState());
	EXPECT_FALSE(remote.IsRunning());
}


TEST_F(LegacyTest, UnreachableAfterPairing)
{
	config.port = UnusedPort();
	config.paired = true;
	samsungLegacy remote(config, discovery);
	EXPECT_FALSE(remote.Open());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote.GetState());
	EXPECT_FALSE(remote.IsRunning());
}


TEST_F(LegacyTest, PairingTimeout)
{
	FakeLegacyTV server({FakeLegacyTV::Waiting()});
	config.port = server.GetPort();
	config.pairing_timeout = 1;

	samsungLegacy remote(config, discovery);
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	EXPECT_FALSE(remote.Open());
	EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
	EXPECT_EQ(Samsung::Legacy::Pairing::IDLE, remote.GetPairingState());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote.GetState());
	EXPECT_FALSE(config.paired);
}


TEST_F(LegacyTest, ControlWhileDisconnected)
{
	config.port = UnusedPort();
	samsungLegacy remote(config, discovery);
	EXPECT_FALSE(remote.Control("KEY_MUTE"));
	EXPECT_FALSE(remote.GetPower());
	// nothing to switch off
	remote.SetPower(false);
}


TEST_F(LegacyTest, ReconnectsAfterDrop)
{
	FakeLegacyTV server({FakeLegacyTV::Granted()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	ASSERT_TRUE(remote.Open());
	ASSERT_TRUE(WaitUntil([&]() { return server.GetConnectionCount() == 1; }, 2000));

	server.DropClient();
	ASSERT_TRUE(WaitUntil([&]() { return (remote.GetReconnectCount() == 1) && (remote.GetState() == Samsung::Connection::State::OPEN); }, 5000));
	EXPECT_EQ(2u, server.GetConnectionCount());
	EXPECT_EQ(1u, remote.GetLoopCount());
	EXPECT_EQ(1u, remote.GetPeakLoops());
	EXPECT_EQ(2, discovery->GetCallCount());

	EXPECT_TRUE(remote.Control("KEY_CHUP"));
	ASSERT_TRUE(WaitUntil([&]() { return server.GetKeys().size() == 1; }, 2000));
	EXPECT_EQ("KEY_CHUP", server.GetKeys()[0]);
	remote.Close();
}


TEST_F(LegacyTest, CloseIsIdempotent)
{
	FakeLegacyTV server({FakeLegacyTV::Granted()});
	config.port = server.GetPort();

	samsungLegacy remote(config, discovery);
	ASSERT_TRUE(remote.Open());
	remote.Close();
	EXPECT_FALSE(remote.IsRunning());
	EXPECT_FALSE(remote.GetPower());
	EXPECT_EQ(Samsung::Connection::State::DISCONNECTED, remote.GetState());
	EXPECT_TRUE(remote.GetCapabilities().IsEmpty());

	EXPECT_NO_THROW(remote.Close());
	EXPECT_FALSE(remote.Control("KEY_MUTE"));
}
