#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief starts the given action as a new
 * greenthread, which first runs when the current
 * greenthread yields.
 *
 * @desc The returned action completes at once.
 * An exception escaping the new greenthread is
 * reported on stderr and the loop goes on; modules
 * on the bus use Router::concurrent, which ends
 * the greenthread quietly on Router::Shutdown.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* !defined(EV_CONCURRENT_HPP) */
