#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief suspends the current greenthread until
 * the next idle turn of the main loop.
 *
 * @desc Other greenthreads run in the meantime,
 * so any state shared with them may have changed
 * when this resumes.
 */
Ev::Io<void> yield();

/* Yields the given number of times; zero does
 * not suspend at all.  Mostly for tests.
 */
Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
