#ifndef UTIL_EITHER_HPP
#define UTIL_EITHER_HPP

#include"Util/BacktraceException.hpp"
#include<new>
#include<stdexcept>
#include<utility>

namespace Util {

/** class Util::Either<L, R>
 *
 * @brief An object that can contain either a type `L`
 * or a type `R`, i.e. a typesafe sum type.
 *
 * @desc By convention `L` is the failure type and `R`
 * the success type.
 */
template<typename L, typename R>
class Either {
private:
	/* A union so that alignment requirements of both
	 * types propagate to the top.
	 */
	union U {
		L l;
		R r;
		/* Construction and destruction are handled by
		 * the owning `Either`.
		 */
		U() { }
		~U() { }
	} u;
	bool is_left_;

	struct UnInit { };
	explicit Either(UnInit) { }

	void destroy() {
		if (is_left_)
			u.l.~L();
		else
			u.r.~R();
	}

public:
	static
	Either left(L obj) {
		auto rv = Either(UnInit());
		rv.is_left_ = true;
		new(&rv.u.l) L(std::move(obj));
		return rv;
	}
	static
	Either right(R obj) {
		auto rv = Either(UnInit());
		rv.is_left_ = false;
		new(&rv.u.r) R(std::move(obj));
		return rv;
	}

	/* Default-constructed left.  */
	Either() : is_left_(true) {
		new(&u.l) L();
	}
	Either(Either const& o) : is_left_(o.is_left_) {
		if (is_left_)
			new(&u.l) L(o.u.l);
		else
			new(&u.r) R(o.u.r);
	}
	Either(Either&& o) : is_left_(o.is_left_) {
		if (is_left_)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
	}
	~Either() { destroy(); }

	Either& operator=(Either const& o) {
		if (this == &o)
			return *this;
		return *this = Either(o);
	}
	Either& operator=(Either&& o) {
		if (this == &o)
			return *this;
		destroy();
		is_left_ = o.is_left_;
		if (is_left_)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
		return *this;
	}

	bool is_left() const { return is_left_; }
	bool is_right() const { return !is_left_; }

	L const& left() const {
		if (!is_left_)
			throw Util::BacktraceException<std::logic_error>(
				"Util::Either: not a left value."
			);
		return u.l;
	}
	R const& right() const {
		if (is_left_)
			throw Util::BacktraceException<std::logic_error>(
				"Util::Either: not a right value."
			);
		return u.r;
	}

	/** Inspect the contents.  */
	template<typename FL, typename FR>
	void match(FL fl, FR fr) const {
		if (is_left_)
			fl(u.l);
		else
			fr(u.r);
	}
};

template<typename L, typename R>
bool operator==(Util::Either<L,R> const& a, Util::Either<L,R> const& b) {
	if (a.is_left() != b.is_left())
		return false;
	if (a.is_left())
		return a.left() == b.left();
	return a.right() == b.right();
}
template<typename L, typename R>
bool operator!=(Util::Either<L,R> const& a, Util::Either<L,R> const& b) {
	return !(a == b);
}

}

#endif /* !defined(UTIL_EITHER_HPP) */
