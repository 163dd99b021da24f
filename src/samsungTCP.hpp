/*
 *	Client interface for local Samsung TV access
 *
 *	This is the base TCP communication class used by the legacy remote.
 *
 *	The socket is opened in non blocking mode. All waiting is done through
 *	poll() with an explicit timeout so that a calling thread can check for
 *	stop requests in between reads.
 *
 *	Common functions:
 *	 - ConnectToDevice(hostname|IP_address, port, timeout, abort)
 *		Opens a TCP connection with the device, waiting at most `timeout`
 *		milliseconds for the connection to complete. The optional `abort`
 *		function is checked while waiting and ends the attempt when it
 *		returns true.
 *		Returns true|false indicating success or failure
 *	 - send(buffer)
 *		Sends all bytes of `buffer` to the device
 *		Returns number of bytes sent or -1 if an error occurred
 *	 - receive(buffer[], maxsize, timeout)
 *		Fills `buffer` with at most `maxsize` bytes, waiting at most `timeout`
 *		milliseconds for data to arrive
 *		Returns number of bytes received, 0 if the device closed the
 *		connection or -1 if an error occurred or no data arrived in time
 *	 - receiveExact(buffer, size, timeout)
 *		Reads exactly `size` bytes, `timeout` applies to each wait
 *		Returns true|false
 *	 - disconnect()
 *		Closes the connection with the device
 *	 - getlasterror()
 *		Use this instead of referencing `errno`, which may be polluted
 *		Returns the last error state of the connection
 *	 - isSocketReadable(timeout)
 *		Returns true|false indicating if the connection has data to be read
 *	 - getSocketState()
 *		Returns one of Samsung::TCP::Socket::value
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungTCP
#define _samsungTCP

// Samsung legacy remote control TCP port
#define SAMSUNG_LEGACY_PORT 55000

#include <string>
#include <cstdint>
#include <atomic>
#include <functional>


namespace Samsung {
  namespace TCP {
    namespace Socket {
      enum value {
        NO_SUCH_HOST,
        NO_SOCK_AVAIL,
        FAILED,
        REFUSED,
        DISCONNECTED,
        CONNECTING,
        CONNECTED
      }; // enum value
    }; // namespace Socket
  }; // namespace TCP
}; // namespace Samsung


class samsungTCP
{

public:
	samsungTCP();
	virtual ~samsungTCP();

	Samsung::TCP::Socket::value getSocketState() const;
	bool isConnected() const;

	typedef std::function<bool()> AbortCheck;

	virtual bool ConnectToDevice(const std::string &hostname, const uint16_t port = SAMSUNG_LEGACY_PORT, const int timeout = 5000, const AbortCheck &abort = AbortCheck());
	int send(const std::string &buffer);
	int receive(unsigned char* buffer, const int maxsize, const int timeout);
	bool receiveExact(std::string &buffer, const int size, const int timeout);
	int getlasterror() const;
	void disconnect();
	bool isSocketReadable(const int timeout = 0);

private:
	int getSocketEvents(short events, int timeout);

	int m_sockfd;
	// shared between the sending and the receiving thread
	std::atomic<int> m_lasterror;
	std::atomic<Samsung::TCP::Socket::value> m_socketState;
};

#endif // _samsungTCP
