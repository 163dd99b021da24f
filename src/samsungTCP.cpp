/*
 *	Client interface for local Samsung TV access
 *
 *	This is the base TCP communication class used by the legacy remote.
 *
 *	See samsungTCP.hpp for a description of the public functions.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#define SOCKET_SEND_TIMEOUT_MSECS 2000
#define SOCKET_CONNECT_POLL_MSECS 100

#include "samsungTCP.hpp"
#include <unistd.h>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>

#ifdef DEBUG
#include <iostream>
#endif


samsungTCP::samsungTCP()
{
	m_sockfd = -1;
	m_lasterror = 0;
	m_socketState = Samsung::TCP::Socket::DISCONNECTED;
}


samsungTCP::~samsungTCP()
{
	disconnect();
}


Samsung::TCP::Socket::value samsungTCP::getSocketState() const
{
	return m_socketState;
}


bool samsungTCP::isConnected() const
{
	return (m_socketState == Samsung::TCP::Socket::CONNECTED);
}


bool samsungTCP::isSocketReadable(const int timeout)
{
	return (getSocketEvents(POLLIN, timeout) == 0);
}


bool samsungTCP::ConnectToDevice(const std::string &hostname, const uint16_t port, const int timeout, const AbortCheck &abort)
{
	disconnect();

	struct sockaddr_in serv_addr;
	memset((char*)&serv_addr, 0, sizeof(serv_addr));
	serv_addr.sin_family = AF_INET;

	if ((!hostname.empty()) && ((hostname[0] ^ 0x30) < 10))
	{
		if (inet_pton(AF_INET, hostname.c_str(), &serv_addr.sin_addr) != 1)
		{
			m_socketState = Samsung::TCP::Socket::NO_SUCH_HOST;
			return false;
		}
	}
	else
	{
		struct addrinfo hints;
		memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_INET;
		hints.ai_socktype = SOCK_STREAM;
		struct addrinfo *addr;
		if (getaddrinfo(hostname.c_str(), nullptr, &hints, &addr) != 0)
		{
			m_socketState = Samsung::TCP::Socket::NO_SUCH_HOST;
			return false;
		}
		memcpy(&serv_addr, addr->ai_addr, sizeof(sockaddr_in));
		freeaddrinfo(addr);
	}

	m_sockfd = socket(AF_INET, SOCK_STREAM, 0);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		m_socketState = Samsung::TCP::Socket::NO_SOCK_AVAIL;
		return false;
	}

	// set nonblocking mode
	int sockopts = fcntl(m_sockfd, F_GETFL, 0);
	if ((sockopts == -1) || (fcntl(m_sockfd, F_SETFL, sockopts | O_NONBLOCK) == -1))
	{
		m_lasterror = errno;
		disconnect();
		m_socketState = Samsung::TCP::Socket::FAILED;
		return false;
	}

	serv_addr.sin_port = htons(port);
	m_socketState = Samsung::TCP::Socket::CONNECTING;
	if (connect(m_sockfd, (const sockaddr*)&serv_addr, sizeof(serv_addr)) == 0)
	{
		m_socketState = Samsung::TCP::Socket::CONNECTED;
		m_lasterror = 0;
		return true;
	}

	m_lasterror = errno;
	if (errno == EINPROGRESS)
	{
		// wait in slices so that an abort request is noticed
		int remaining = timeout;
		while (remaining > 0)
		{
			if (abort && abort())
			{
				m_lasterror = ECANCELED;
				break;
			}
			int slice = (remaining > SOCKET_CONNECT_POLL_MSECS) ? SOCKET_CONNECT_POLL_MSECS : remaining;
			remaining -= slice;
			if (getSocketEvents(POLLOUT, slice) == 0)
			{
				m_socketState = Samsung::TCP::Socket::CONNECTED;
				m_lasterror = 0;
				return true;
			}
			if (m_lasterror != EAGAIN)
				break;
		}
	}

#ifdef DEBUG
	std::cout << "dbg: connect to " << hostname << ":" << port << " failed: " << strerror(m_lasterror.load()) << "\n";
#endif
	int lasterror = m_lasterror;
	disconnect();
	m_lasterror = lasterror;
	if (m_lasterror == ECONNREFUSED)
		m_socketState = Samsung::TCP::Socket::REFUSED;
	else
		m_socketState = Samsung::TCP::Socket::FAILED;
	return false;
}


int samsungTCP::send(const std::string &buffer)
{
	if (m_sockfd < 0)
	{
		m_lasterror = ENOTCONN;
		return -1;
	}

	size_t bufferpos = 0;
	while (bufferpos < buffer.length())
	{
		ssize_t numbytes = ::send(m_sockfd, buffer.c_str() + bufferpos, buffer.length() - bufferpos, MSG_NOSIGNAL);
		if (numbytes < 0)
		{
			m_lasterror = errno;
			if (((errno == EAGAIN) || (errno == EWOULDBLOCK)) && (getSocketEvents(POLLOUT, SOCKET_SEND_TIMEOUT_MSECS) == 0))
				continue;
			m_socketState = Samsung::TCP::Socket::FAILED;
			return -1;
		}
		bufferpos += numbytes;
	}
	return (int)bufferpos;
}


int samsungTCP::receive(unsigned char* buffer, const int maxsize, const int timeout)
{
	if (m_sockfd < 0)
	{
		m_lasterror = ENOTCONN;
		return -1;
	}

	m_lasterror = EAGAIN;
	if (getSocketEvents(POLLIN, timeout) != 0)
		return -1;

	int numbytes = read(m_sockfd, buffer, maxsize);
	if (numbytes < 0)
	{
		m_lasterror = errno;
		if ((errno != EAGAIN) && (errno != EWOULDBLOCK))
			m_socketState = Samsung::TCP::Socket::FAILED;
	}
	else if (numbytes == 0)
	{
		// orderly shutdown by peer
		m_socketState = Samsung::TCP::Socket::DISCONNECTED;
	}
	return numbytes;
}


bool samsungTCP::receiveExact(std::string &buffer, const int size, const int timeout)
{
	buffer.clear();
	unsigned char cReceiveBuffer[1024];
	while ((int)buffer.length() < size)
	{
		int wanted = size - (int)buffer.length();
		if (wanted > (int)sizeof(cReceiveBuffer))
			wanted = (int)sizeof(cReceiveBuffer);
		int numbytes = receive(cReceiveBuffer, wanted, timeout);
		if (numbytes <= 0)
			return false;
		buffer.append((const char*)cReceiveBuffer, numbytes);
	}
	return true;
}


int samsungTCP::getlasterror() const
{
	return m_lasterror;
}


void samsungTCP::disconnect()
{
	if (m_sockfd >= 0)
		close(m_sockfd);
	m_sockfd = -1;
	m_socketState = Samsung::TCP::Socket::DISCONNECTED;
}


/* private */ int samsungTCP::getSocketEvents(short events, int timeout)
{
	if (m_sockfd < 0)
		return -1;

	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeout);
	if (result > 0)
	{
		// a failed connect reports POLLOUT together with POLLERR
		if ((fds.revents & events) && !(fds.revents & POLLERR))
		{
			// readable with POLLHUP still holds the remaining data or the EOF marker
			m_lasterror = 0;
			return m_lasterror;
		}
		if (fds.revents & (POLLERR | POLLHUP | POLLNVAL))
		{
			m_socketState = Samsung::TCP::Socket::FAILED;
			// try to get socket error
			int sockerr = 0;
			socklen_t len = sizeof sockerr;
			if ((getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len) >= 0) && (sockerr > 0))
				m_lasterror = sockerr;
			else
				m_lasterror = ECONNRESET;
			return m_lasterror;
		}
	}
	else if (result == 0)
	{
		m_lasterror = EAGAIN;
	}
	else
	{
		m_lasterror = errno;
		m_socketState = Samsung::TCP::Socket::FAILED;
	}
	return -1;
}
