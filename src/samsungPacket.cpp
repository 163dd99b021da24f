/*
 *	Client interface for local Samsung TV access
 *
 *	Legacy remote control packet codec
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungPacket.hpp"
#include "samsungErrors.hpp"
#include "crypt/base64.hpp"
#include <stdexcept>

#ifdef DEBUG
#include "samsungLog.hpp"
#endif


namespace Samsung {
  namespace Legacy {
    namespace Sentinel {
      static const std::string HANDSHAKE_OPCODE("\x64\x00", 2);
      static const std::string ACCESS_GRANTED("\x64\x00\x01\x00", 4);
      static const std::string ACCESS_DENIED("\x64\x00\x00\x00", 4);
      static const std::string CONTROL_ACCEPTED("\x00\x00\x00\x00", 4);
      static const std::string PACKET_PREFIX("\x00\x00\x00", 3);
      static const char WAITING_FOR_USER = 0x0a;
      static const char AUTH_CANCELLED = 0x65;
    }; // namespace Sentinel
  }; // namespace Legacy
}; // namespace Samsung


std::string samsungPacket::SerializeString(const std::string &szPayload, const bool raw)
{
	std::string szBody = raw ? szPayload : Samsung::base64_encode(szPayload);
	if (szBody.length() > 0xFF)
		throw std::invalid_argument("legacy packet field exceeds 255 bytes");

	std::string szResult;
	szResult.append(1, (char)(szBody.length() & 0xFF));
	szResult.append(1, '\0');
	szResult.append(szBody);
	return szResult;
}


std::string samsungPacket::BuildHandshake(const std::string &szDescription, const std::string &szID, const std::string &szName)
{
	std::string szPayload = Samsung::Legacy::Sentinel::HANDSHAKE_OPCODE;
	szPayload.append(SerializeString(szDescription));
	szPayload.append(SerializeString(szID));
	szPayload.append(SerializeString(szName));

	std::string szPacket = Samsung::Legacy::Sentinel::PACKET_PREFIX;
	szPacket.append(SerializeString(szPayload, true));
#ifdef DEBUG
	Samsung::Log::Debug("handshake packet: " + Samsung::Log::Hex(szPacket));
#endif
	return szPacket;
}


std::string samsungPacket::BuildControl(const std::string &szKey)
{
	std::string szPayload = Samsung::Legacy::Sentinel::PACKET_PREFIX;
	szPayload.append(SerializeString(szKey));

	std::string szPacket = Samsung::Legacy::Sentinel::PACKET_PREFIX;
	szPacket.append(SerializeString(szPayload, true));
#ifdef DEBUG
	Samsung::Log::Debug("control packet: " + Samsung::Log::Hex(szPacket));
#endif
	return szPacket;
}


std::string samsungPacket::DecodeControl(const std::string &szPacket)
{
	const std::string &prefix = Samsung::Legacy::Sentinel::PACKET_PREFIX;
	if (szPacket.compare(0, prefix.length(), prefix) != 0)
		throw Samsung::UnhandledResponse(szPacket);

	size_t bufferpos = prefix.length();
	std::string szPayload;
	if (!UnwrapString(szPacket, bufferpos, szPayload, true) || (szPayload.compare(0, prefix.length(), prefix) != 0))
		throw Samsung::UnhandledResponse(szPacket);

	bufferpos = prefix.length();
	std::string szKey;
	if (!UnwrapString(szPayload, bufferpos, szKey, false))
		throw Samsung::UnhandledResponse(szPacket);
	return szKey;
}


bool samsungPacket::ParseFrame(const std::string &szBuffer, std::string &szDeviceName, std::string &szResponse, size_t &consumed)
{
	consumed = 0;
	if (szBuffer.length() < LEGACY_FRAME_HEADER_SIZE)
		return false;

	size_t bufferpos = LEGACY_FRAME_HEADER_SIZE;
	uint16_t namesize = ReadLength(szBuffer, 1);
	if (szBuffer.length() < bufferpos + namesize + LEGACY_LENGTH_FIELD_SIZE)
		return false;
	szDeviceName = szBuffer.substr(bufferpos, namesize);
	bufferpos += namesize;

	uint16_t responsesize = ReadLength(szBuffer, bufferpos);
	bufferpos += LEGACY_LENGTH_FIELD_SIZE;
	if (szBuffer.length() < bufferpos + responsesize)
		return false;
	szResponse = szBuffer.substr(bufferpos, responsesize);
	consumed = bufferpos + responsesize;
	return true;
}


std::string samsungPacket::ReadFrame(samsungTCP &socket, std::string &szDeviceName, const int timeout)
{
	std::string szHeader;
	if (!socket.receiveExact(szHeader, LEGACY_FRAME_HEADER_SIZE, timeout))
		throw Samsung::ConnectionClosed();

	if (!socket.receiveExact(szDeviceName, ReadLength(szHeader, 1), timeout))
		throw Samsung::ConnectionClosed();

	std::string szLength;
	if (!socket.receiveExact(szLength, LEGACY_LENGTH_FIELD_SIZE, timeout))
		throw Samsung::ConnectionClosed();

	std::string szResponse;
	uint16_t responsesize = ReadLength(szLength, 0);
	if ((responsesize == 0) || !socket.receiveExact(szResponse, responsesize, timeout))
		throw Samsung::ConnectionClosed();

#ifdef DEBUG
	Samsung::Log::Debug("response from '" + szDeviceName + "': " + Samsung::Log::Hex(szResponse));
#endif
	return szResponse;
}


Samsung::Legacy::Response::value samsungPacket::Classify(const std::string &szResponse)
{
	if (szResponse == Samsung::Legacy::Sentinel::ACCESS_GRANTED)
		return Samsung::Legacy::Response::GRANTED;
	if (szResponse == Samsung::Legacy::Sentinel::ACCESS_DENIED)
		return Samsung::Legacy::Response::DENIED;
	if (szResponse.empty())
		return Samsung::Legacy::Response::UNKNOWN;
	if (szResponse[0] == Samsung::Legacy::Sentinel::WAITING_FOR_USER)
		return Samsung::Legacy::Response::WAITING;
	if (szResponse[0] == Samsung::Legacy::Sentinel::AUTH_CANCELLED)
		return Samsung::Legacy::Response::CANCELLED;
	if (szResponse == Samsung::Legacy::Sentinel::CONTROL_ACCEPTED)
		return Samsung::Legacy::Response::ACCEPTED;
	return Samsung::Legacy::Response::UNKNOWN;
}


/* private */ uint16_t samsungPacket::ReadLength(const std::string &szBuffer, const size_t offset)
{
	return (uint16_t)(((uint8_t)szBuffer[offset] << 8) + (uint8_t)szBuffer[offset + 1]);
}


/* private */ bool samsungPacket::UnwrapString(const std::string &szBuffer, size_t &bufferpos, std::string &szPayload, const bool raw)
{
	if (szBuffer.length() < bufferpos + 2)
		return false;
	size_t payloadsize = (uint8_t)szBuffer[bufferpos];
	bufferpos += 2;
	if (szBuffer.length() < bufferpos + payloadsize)
		return false;

	std::string szBody = szBuffer.substr(bufferpos, payloadsize);
	bufferpos += payloadsize;
	if (raw)
	{
		szPayload = szBody;
		return true;
	}
	return Samsung::base64_decode(szBody, szPayload);
}
