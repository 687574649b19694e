#ifndef ROUTER_CONCURRENT_HPP
#define ROUTER_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Router {

/** Router::concurrent.
 *
 * @brief Like Ev::concurrent except it ignores
 * Router::Shutdown exceptions in the new greenthread.
 *
 * @desc Schedules a new greenthread for launching
 * later.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(ROUTER_CONCURRENT_HPP) */
