/*
 *	Client interface for local Samsung TV access
 *
 *	Legacy (pre 2014) remote control packet codec
 *
 *	Outbound packets are built from length prefixed strings:
 *		[len:1][0x00][payload]
 *	where payload is base64 encoded unless it is itself a serialized
 *	packet body. Inbound frames are read as:
 *		[reserved:1][len:2][device name][len:2][response]
 *	with big-endian lengths.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungPacket
#define _samsungPacket

#define LEGACY_FRAME_HEADER_SIZE 3
#define LEGACY_LENGTH_FIELD_SIZE 2

#include "samsungTCP.hpp"
#include <string>
#include <cstdint>


namespace Samsung {
  namespace Legacy {
    namespace Response {
      enum value {
        GRANTED,
        DENIED,
        WAITING,
        CANCELLED,
        ACCEPTED,
        UNKNOWN
      }; // enum value
    }; // namespace Response
  }; // namespace Legacy
}; // namespace Samsung


class samsungPacket
{
public:
	static std::string SerializeString(const std::string &szPayload, const bool raw = false);
	static std::string BuildHandshake(const std::string &szDescription, const std::string &szID, const std::string &szName);
	static std::string BuildControl(const std::string &szKey);

	// recover the key name from a packet created by BuildControl()
	static std::string DecodeControl(const std::string &szPacket);

	// decode a single inbound frame from an in-memory buffer
	// returns false if the buffer does not yet hold a complete frame
	static bool ParseFrame(const std::string &szBuffer, std::string &szDeviceName, std::string &szResponse, size_t &consumed);

	// read a single inbound frame from the socket, `timeout` applies to each wait
	// throws Samsung::ConnectionClosed if the response is empty or the socket fails
	static std::string ReadFrame(samsungTCP &socket, std::string &szDeviceName, const int timeout);

	static Samsung::Legacy::Response::value Classify(const std::string &szResponse);

private:
	static uint16_t ReadLength(const std::string &szBuffer, const size_t offset);
	static bool UnwrapString(const std::string &szBuffer, size_t &bufferpos, std::string &szPayload, const bool raw);
};

#endif // _samsungPacket
