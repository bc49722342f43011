#undef NDEBUG
#include"Util/BacktraceException.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

namespace {

void thrower(int depth) {
	if (depth == 0)
		throw Util::BacktraceException<std::invalid_argument>("bad share");
	thrower(depth - 1);
}

}

int main() {
	auto caught = false;
	try {
		thrower(3);
	} catch (std::invalid_argument const& e) {
		caught = true;
		auto msg = std::string(e.what());
		/* The original message always leads.  */
		assert(msg.substr(0, 9) == "bad share");
#if ENABLE_EXCEPTION_BACKTRACE
		assert(msg.find("\nBacktrace:\n#0 ") != std::string::npos);
		/* Formatted once.  */
		assert(e.what() == e.what());
#else
		assert(msg == "bad share");
#endif
	}
	assert(caught);

	/* Still one of the standard families.  */
	try {
		throw Util::BacktraceException<std::runtime_error>("node down");
	} catch (std::exception const& e) {
		assert(std::string(e.what()).find("node down") == 0);
	}

	return 0;
}
