/*
 *	Client interface for local Samsung TV access
 *
 *	Remote control for TVs built before 2014, talking the binary protocol
 *	on TCP port 55000.
 *
 *	Common functions:
 *	 - Open()
 *		Connects and pairs with the TV, then starts the background loop
 *		On first pairing the user must confirm the request on the TV.
 *		Returns false if the TV can not be reached but was paired before.
 *		Throws Samsung::ConnectionRefused if it was never paired,
 *		Samsung::AccessDenied if the user denied or cancelled the request,
 *		Samsung::UnhandledResponse on any other answer.
 *	 - Control(key)
 *		Sends a key press such as KEY_VOLUP, spaced at least 200ms apart
 *		Returns false if not connected
 *	 - Close()
 *		Stops the background loop and closes the connection
 *		An Open() waiting for confirmation on the TV returns false
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungLegacy
#define _samsungLegacy

#define LEGACY_RETRY_DELAY_MSECS 2000
#define LEGACY_JOIN_TIMEOUT_MSECS 2000
#define LEGACY_CONNECT_TIMEOUT_MSECS 5000
#define LEGACY_POLL_MSECS 200
#define LEGACY_READ_TIMEOUT_MSECS 1000
#define LEGACY_KEY_INTERVAL_MSECS 200
#define LEGACY_POWEROFF_INTERVAL_MSECS 2000

#include "samsungSupervisor.hpp"
#include "samsungTCP.hpp"
#include <string>
#include <mutex>
#include <atomic>


namespace Samsung {
  namespace Legacy {
    namespace Pairing {
      enum value {
        IDLE,
        CONNECTING,
        AWAITING_AUTH,
        PAIRED,
        DENIED,
        CANCELLED
      }; // enum value
    }; // namespace Pairing
  }; // namespace Legacy
}; // namespace Samsung


class samsungLegacy : public samsungSupervisor
{
public:
	samsungLegacy(Samsung::Config &config, const std::shared_ptr<Samsung::UPnP::Discovery> &discovery = nullptr);
	~samsungLegacy() override;

	bool Open();
	bool Control(const std::string &szKey);

	Samsung::Legacy::Pairing::value GetPairingState() const;

	bool GetPower() override;
	void SetPower(const bool power);

protected:
	bool OpenTransport() override;
	bool Authenticate() override;
	Samsung::Connection::Receive::value Receive(std::string &szFrame) override;
	void OnMessage(const std::string &szFrame) override;
	void OnDisconnect() override;
	void ResetTransport() override;

private:
	samsungTCP m_socket;
	std::mutex m_sendMutex;
	std::atomic<int> m_pairingState;
};

#endif // _samsungLegacy
