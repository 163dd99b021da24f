/*
 *	Client interface for local Samsung TV access
 *
 *	Exception types raised by the protocol and API layers. The socket layer
 *	reports through return values and Samsung::TCP::Socket states instead.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungErrors
#define _samsungErrors

#include <stdexcept>
#include <string>


namespace Samsung {

class Error : public std::runtime_error
{
public:
	explicit Error(const std::string &what) : std::runtime_error(what) {}
};


// peer closed the connection (zero length response)
class ConnectionClosed : public Error
{
public:
	ConnectionClosed() : Error("connection closed by TV") {}
};


// unable to reach a TV that we have never paired with
class ConnectionRefused : public Error
{
public:
	explicit ConnectionRefused(const std::string &host) : Error("unable to pair with TV at " + host + ", is the TV on?") {}
};


class AccessDenied : public Error
{
public:
	AccessDenied() : Error("access denied by TV") {}
};


class UnhandledResponse : public Error
{
public:
	explicit UnhandledResponse(const std::string &raw) : Error("unhandled response from TV"), m_raw(raw) {}

	// raw response bytes for diagnostics
	const std::string &raw() const { return m_raw; }

private:
	std::string m_raw;
};


// the background loop failed to terminate within the join timeout
class ShutdownTimeout : public Error
{
public:
	ShutdownTimeout() : Error("loop thread did not properly terminate") {}
};


class XMLError : public Error
{
public:
	explicit XMLError(const std::string &what) : Error("XML parse error: " + what) {}
};

}; // namespace Samsung

#endif // _samsungErrors
