/*
 *	Client interface for local Samsung TV access
 *
 *	Plain HTTP requests against the TV
 *
 *	Used for the device info request on port 8001 and for UPnP description
 *	retrieval and SOAP action invocation. Every request runs on its own
 *	io_context and is bounded by `timeout` milliseconds as a whole.
 *
 *	 - Get(url, timeout, response)
 *	 - Post(url, headers, body, timeout, response)
 *		Return false on resolve/connect/transfer errors and timeouts. Any
 *		HTTP status, including error codes, is a successful transfer.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungHTTP
#define _samsungHTTP

#define SAMSUNG_USER_AGENT "samsungtvpp/1.0"

#include <string>
#include <vector>
#include <utility>
#include <cstdint>


namespace Samsung {
  namespace HTTP {

	struct Url
	{
		std::string host;
		uint16_t port = 80;
		std::string target = "/";
	};

	struct Response
	{
		unsigned int status = 0;
		std::string body;
	};

	typedef std::vector<std::pair<std::string, std::string> > Headers;

	// accepts http://host[:port][/target]
	bool ParseUrl(const std::string &szUrl, Url &url);

	// resolve a possibly relative reference against an absolute base url
	std::string ResolveUrl(const std::string &szBase, const std::string &szReference);

	bool Get(const Url &url, const int timeout, Response &response);
	bool Post(const Url &url, const Headers &headers, const std::string &szBody, const int timeout, Response &response);

  }; // namespace HTTP
}; // namespace Samsung

#endif // _samsungHTTP
