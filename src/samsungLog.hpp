/*
 *	Client interface for local Samsung TV access
 *
 *	Log output
 *
 *	All library components report progress through these functions. Output
 *	goes to std::cout unless the application hands in its own stream:
 *	 - SetOutput(&stream)
 *		Redirect log lines to `stream`, nullptr restores std::cout
 *	 - SetLevel(Samsung::Log::Level::...)
 *		Drop messages below the given level (default Info)
 *	 - Debug|Info|Warning|Error(message)
 *		Write a single line, prefixed with the level name
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungLog
#define _samsungLog

#include <string>
#include <ostream>


namespace Samsung {
  namespace Log {

	enum class Level {
		Debug,
		Info,
		Warning,
		Error
	};

	void SetOutput(std::ostream *out);
	void SetLevel(Level level);
	Level GetLevel();

	void Write(Level level, const std::string &message);

	inline void Debug(const std::string &message) { Write(Level::Debug, message); }
	inline void Info(const std::string &message) { Write(Level::Info, message); }
	inline void Warning(const std::string &message) { Write(Level::Warning, message); }
	inline void Error(const std::string &message) { Write(Level::Error, message); }

	// hex representation of a raw byte buffer for debug output
	std::string Hex(const std::string &bytes);

  }; // namespace Log
}; // namespace Samsung

#endif // _samsungLog
