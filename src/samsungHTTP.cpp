/*
 *	Client interface for local Samsung TV access
 *
 *	Plain HTTP requests against the TV
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungHTTP.hpp"
#include "samsungLog.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdlib>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;


namespace {

bool Request(const http::verb verb, const Samsung::HTTP::Url &url, const Samsung::HTTP::Headers &headers, const std::string &szBody, const int timeout, Samsung::HTTP::Response &response)
{
	net::io_context ioc;
	tcp::resolver resolver(ioc);
	beast::tcp_stream stream(ioc);
	beast::error_code ec;

	tcp::resolver::results_type results = resolver.resolve(url.host, std::to_string(url.port), ec);
	if (ec)
	{
		Samsung::Log::Debug("unable to resolve " + url.host + ": " + ec.message());
		return false;
	}

	http::request<http::string_body> req(verb, url.target, 11);
	req.set(http::field::host, url.host + ":" + std::to_string(url.port));
	req.set(http::field::user_agent, SAMSUNG_USER_AGENT);
	for (size_t i = 0; i < headers.size(); i++)
		req.set(headers[i].first, headers[i].second);
	if (!szBody.empty())
		req.body() = szBody;
	req.prepare_payload();

	beast::flat_buffer buffer;
	http::response<http::string_body> res;
	bool complete = false;

	// the expiry covers connect, write and read together
	stream.expires_after(std::chrono::milliseconds(timeout));
	stream.async_connect(results, [&](beast::error_code connect_ec, const tcp::endpoint &)
	{
		if (connect_ec)
		{
			ec = connect_ec;
			return;
		}
		http::async_write(stream, req, [&](beast::error_code write_ec, std::size_t)
		{
			if (write_ec)
			{
				ec = write_ec;
				return;
			}
			http::async_read(stream, buffer, res, [&](beast::error_code read_ec, std::size_t)
			{
				ec = read_ec;
				complete = !read_ec;
			});
		});
	});
	ioc.run();

	beast::error_code ignored;
	stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

	if (!complete)
	{
		Samsung::Log::Debug("http request to " + url.host + url.target + " failed: " + ec.message());
		return false;
	}

	response.status = res.result_int();
	response.body = res.body();
	return true;
}

}; // namespace


bool Samsung::HTTP::ParseUrl(const std::string &szUrl, Url &url)
{
	const std::string scheme = "http://";
	if (szUrl.compare(0, scheme.length(), scheme) != 0)
		return false;

	size_t hoststart = scheme.length();
	size_t targetstart = szUrl.find('/', hoststart);
	std::string szAuthority = szUrl.substr(hoststart, (targetstart == std::string::npos) ? std::string::npos : targetstart - hoststart);
	if (szAuthority.empty())
		return false;

	url.target = (targetstart == std::string::npos) ? "/" : szUrl.substr(targetstart);
	size_t portstart = szAuthority.find(':');
	if (portstart == std::string::npos)
	{
		url.host = szAuthority;
		url.port = 80;
		return true;
	}

	url.host = szAuthority.substr(0, portstart);
	char *end = nullptr;
	long port = strtol(szAuthority.c_str() + portstart + 1, &end, 10);
	if ((end == nullptr) || (*end != '\0') || (port <= 0) || (port > 65535) || url.host.empty())
		return false;
	url.port = (uint16_t)port;
	return true;
}


std::string Samsung::HTTP::ResolveUrl(const std::string &szBase, const std::string &szReference)
{
	if (szReference.compare(0, 7, "http://") == 0)
		return szReference;

	Url base;
	if (!ParseUrl(szBase, base))
		return szReference;

	std::string szOrigin = "http://" + base.host + ":" + std::to_string(base.port);
	if ((!szReference.empty()) && (szReference[0] == '/'))
		return szOrigin + szReference;

	// relative to the directory of the base target
	std::string szDirectory = base.target.substr(0, base.target.rfind('/') + 1);
	return szOrigin + szDirectory + szReference;
}


bool Samsung::HTTP::Get(const Url &url, const int timeout, Response &response)
{
	return Request(http::verb::get, url, Headers(), "", timeout, response);
}


bool Samsung::HTTP::Post(const Url &url, const Headers &headers, const std::string &szBody, const int timeout, Response &response)
{
	return Request(http::verb::post, url, headers, szBody, timeout, response);
}
