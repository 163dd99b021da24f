/*
 *	Client interface for local Samsung TV access
 *
 *	Base64 encode/decode module
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsung_base64
#define _samsung_base64

#include <openssl/evp.h>
#include <string>
#include <vector>


namespace Samsung {

static std::string base64_encode(const std::string &szInput)
{
	if (szInput.empty())
		return "";

	// 4 output chars for every 3 input bytes plus terminating null
	std::vector<unsigned char> cOutputBuffer(((szInput.length() + 2) / 3) * 4 + 1);
	int outputSize = EVP_EncodeBlock(&cOutputBuffer[0], (const unsigned char*)szInput.c_str(), (int)szInput.length());
	if (outputSize < 0)
		return "";
	return std::string((const char*)&cOutputBuffer[0], outputSize);
}


// returns false if szInput is not valid base64
static bool base64_decode(const std::string &szInput, std::string &szOutput)
{
	szOutput.clear();
	if (szInput.empty())
		return true;
	if (szInput.length() % 4 != 0)
		return false;

	std::vector<unsigned char> cOutputBuffer((szInput.length() / 4) * 3 + 1);
	int outputSize = EVP_DecodeBlock(&cOutputBuffer[0], (const unsigned char*)szInput.c_str(), (int)szInput.length());
	if (outputSize < 0)
		return false;

	// EVP_DecodeBlock does not account for padding
	size_t padding = 0;
	if (szInput[szInput.length() - 1] == '=')
		padding++;
	if (szInput[szInput.length() - 2] == '=')
		padding++;
	szOutput.assign((const char*)&cOutputBuffer[0], outputSize - padding);
	return true;
}

}; // namespace Samsung

#endif // _samsung_base64
