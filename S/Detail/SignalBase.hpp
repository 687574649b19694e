#ifndef S_DETAIL_SIGNALBASE_HPP
#define S_DETAIL_SIGNALBASE_HPP

#include<cstddef>

namespace S { namespace Detail {

/* Type-erased base of Signal<a>, so the bus can own
 * signals of every message type in one table.  */
class SignalBase {
public:
	virtual ~SignalBase() { }
	/* Number of registered callbacks.  */
	virtual std::size_t size() const =0;
};

}}

#endif /* !defined(S_DETAIL_SIGNALBASE_HPP) */
