#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the libev main loop with the
 * given action as the initial greenthread.
 *
 * @return the integer the action yields, or
 * 254 if it fails with an exception, or 255
 * if the loop cannot start.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
