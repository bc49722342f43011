#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

#if !ENABLE_EXCEPTION_BACKTRACE

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief the project's wrapper around a standard
 * exception type E.
 *
 * @desc Everything thrown here is one of these,
 * and is still caught by a handler for E.
 * This build does not record where it was
 * thrown; configure with
 * `-DENABLE_EXCEPTION_BACKTRACE=ON` for that.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

}

#else /* ENABLE_EXCEPTION_BACKTRACE */

#include<cstddef>
#include<cstdlib>
#include<exception>
#include<execinfo.h>
#include<sstream>
#include<string>
#include<vector>

#define UNW_LOCAL_ONLY
#include<libunwind.h>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief the project's wrapper around a standard
 * exception type E, recording the call stack at
 * the throw site.
 *
 * @desc The stack is walked with libunwind when
 * the exception is constructed.  Symbol lookup
 * is put off until `what()` is first called,
 * and appends the frames below the original
 * message.
 */
template<typename T>
class BacktraceException : public T {
private:
	static constexpr std::size_t max_frames = 64;

	std::vector<void*> frames;
	mutable std::string message;
	mutable bool formatted;

	void capture() {
		unw_context_t context;
		unw_cursor_t cursor;
		if (unw_getcontext(&context) != 0)
			return;
		if (unw_init_local(&cursor, &context) != 0)
			return;
		while (frames.size() < max_frames && unw_step(&cursor) > 0) {
			unw_word_t ip;
			if (unw_get_reg(&cursor, UNW_REG_IP, &ip) != 0)
				break;
			frames.push_back(reinterpret_cast<void*>(ip));
		}
	}

	std::string format() const {
		auto os = std::ostringstream();
		os << T::what() << "\nBacktrace:";
		char** symbols = backtrace_symbols( frames.data()
						  , int(frames.size())
						  );
		for (auto i = std::size_t(0); i < frames.size(); ++i) {
			os << "\n#" << i << ' ';
			if (symbols)
				os << symbols[i];
			else
				os << frames[i];
		}
		std::free(symbols);
		return os.str();
	}

public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...)
		, formatted(false) {
		capture();
	}

	const char* what() const noexcept override {
		if (!formatted) {
			try {
				message = format();
			} catch (std::exception const&) {
				/* Out of memory: plain message.  */
				return T::what();
			}
			formatted = true;
		}
		return message.c_str();
	}
};

}

#endif /* ENABLE_EXCEPTION_BACKTRACE */

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
