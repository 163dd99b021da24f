/*
 *	Client interface for local Samsung TV access
 *
 *	Log output
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungLog.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <cstdint>


namespace {
	std::mutex s_logMutex;
	std::ostream *s_out = nullptr;
	Samsung::Log::Level s_level = Samsung::Log::Level::Info;

	const char *LevelName(Samsung::Log::Level level)
	{
		switch (level)
		{
			case Samsung::Log::Level::Debug:
				return "debug";
			case Samsung::Log::Level::Info:
				return "info";
			case Samsung::Log::Level::Warning:
				return "warning";
			case Samsung::Log::Level::Error:
				return "error";
		}
		return "";
	}
}; // namespace


void Samsung::Log::SetOutput(std::ostream *out)
{
	std::lock_guard<std::mutex> lock(s_logMutex);
	s_out = out;
}


void Samsung::Log::SetLevel(Level level)
{
	std::lock_guard<std::mutex> lock(s_logMutex);
	s_level = level;
}


Samsung::Log::Level Samsung::Log::GetLevel()
{
	std::lock_guard<std::mutex> lock(s_logMutex);
	return s_level;
}


void Samsung::Log::Write(Level level, const std::string &message)
{
	std::lock_guard<std::mutex> lock(s_logMutex);
	if (level < s_level)
		return;
	std::ostream *out = s_out ? s_out : &std::cout;
	*out << "samsungtv " << LevelName(level) << ": " << message << "\n";
	out->flush();
}


std::string Samsung::Log::Hex(const std::string &bytes)
{
	std::stringstream ss;
	for (size_t i = 0; i < bytes.length(); i++)
		ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>((uint8_t)bytes[i]);
	return ss.str();
}
