#ifndef POOL_LOG_HPP
#define POOL_LOG_HPP

#include<ostream>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Pool {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* Throws `Pool::ConfigError` on an unknown name.  */
LogLevel log_level_from_string(std::string const&);
char const* to_string(LogLevel);

/** class Pool::Logger
 *
 * @brief writes `LEVEL  message` lines, dropping
 * those below the minimum level.
 *
 * @desc `log` formats immediately but only writes
 * when the returned action runs, so lines come
 * out in greenthread order.
 */
class Logger {
private:
	std::ostream& os;
	LogLevel min;

public:
	Logger() =delete;
	explicit
	Logger(std::ostream& os_, LogLevel min_ = Info)
		: os(os_), min(min_) { }

	void set_level(LogLevel l) { min = l; }
	LogLevel get_level() const { return min; }

	Ev::Io<void> log(LogLevel l, const char *fmt, ...)
#if defined(__GNUC__)
		__attribute__ ((format (printf, 3, 4)))
#endif
	;
};

}

#endif /* !defined(POOL_LOG_HPP) */
