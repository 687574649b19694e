#ifndef ROUTER_SHUTDOWN_HPP
#define ROUTER_SHUTDOWN_HPP

namespace Router {

/** struct Router::Shutdown
 *
 * @brief message broadcast on the bus when the
 * router is being torn down, and the exception
 * thrown by blocking Ev::Io operations (timers)
 * when that happens.
 */
struct Shutdown {};

}

#endif /* !defined(ROUTER_SHUTDOWN_HPP) */
