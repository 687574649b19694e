#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief Does nothing, but allows other Ev::Io greenthreads
 * to continue processing.
 *
 * @desc Other concurrent tasks may execute while your task
 * goes through this function, so state you are reading may
 * change across it.
 *
 * @param num_yields - How many times to yield; mostly used
 * by tests to let modules settle.
 */
Ev::Io<void> yield();

Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
