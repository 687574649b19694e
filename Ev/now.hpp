#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief returns the wall-clock time, in seconds
 * from the epoch.
 *
 * @desc Unlike the loop time libev caches per
 * iteration, this is read fresh on every call, so
 * payment deadlines and invoice expiry checks see
 * the real time even in a long iteration.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
