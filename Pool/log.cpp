#include"Ev/Io.hpp"
#include"Pool/Error.hpp"
#include"Pool/log.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Pool {

LogLevel log_level_from_string(std::string const& s) {
	if (s == "trace")
		return Trace;
	if (s == "debug")
		return Debug;
	if (s == "info")
		return Info;
	if (s == "warn")
		return Warn;
	if (s == "error")
		return Error;
	throw ConfigError("unknown log level: " + s);
}

char const* to_string(LogLevel l) {
	switch (l) {
	case Trace: return "TRACE";
	case Debug: return "DEBUG";
	case Info: return "INFO";
	case Warn: return "WARN";
	case Error: return "ERROR";
	}
	return "?";
}

Ev::Io<void> Logger::log(LogLevel l, const char *fmt, ...) {
	if (l < min)
		return Ev::lift();

	va_list ap;
	auto msg = std::string();
	va_start(ap, fmt);
	try {
		msg = Util::Str::vfmt(fmt, ap);
	} catch (...) {
		va_end(ap);
		throw;
	}
	va_end(ap);

	auto line = std::string(to_string(l)) + "  " + msg;
	return Ev::lift().then([this, line]() {
		os << line << std::endl;
		return Ev::lift();
	});
}

}
