#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief spawns the given action as a separate
 * greenthread and returns at once.
 *
 * @desc The spawned action starts on the next idle
 * turn of the loop.  If it fails, the exception is
 * reported on stderr and nothing else is affected.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* !defined(EV_CONCURRENT_HPP) */
