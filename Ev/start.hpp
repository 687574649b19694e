#ifndef EV_START_HPP
#define EV_START_HPP

#include<iosfwd>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief run the given action as the main greenthread
 * on the default libev loop, returning its exit code
 * once the loop has no more pending work.
 *
 * @desc An unhandled exception in the main action
 * gives exit code 254, a main action still waiting
 * when the loop runs out of work gives 253, and a
 * loop that cannot start gives 255.
 * Diagnostics go to `diag`, or to `std::cerr` if
 * none is given.
 */
int start(Io<int> main);
int start(Io<int> main, std::ostream& diag);

}

#endif /* !defined(EV_START_HPP) */
