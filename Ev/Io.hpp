#ifndef EV_IO_HPP
#define EV_IO_HPP

#include"Util/make_unique.hpp"
#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};
/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

/* Base for Io<a>.  */
template<typename a>
class IoBase {
public:
	typedef typename Detail::PassFunc<a>::type PassF;
	typedef std::function<void (std::exception_ptr)> FailF;
	typedef std::function<void (PassF, FailF)> CoreFunc;

protected:
	CoreFunc core;

public:
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief if this action throws an exception of
	 * type `e`, run the handler and continue with the
	 * action it returns.
	 * Other exceptions propagate unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ](PassF pass, FailF fail) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				auto next = std::unique_ptr<Io<a>>();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						next = Util::make_unique<Io<a>>(
							handler(ex)
						);
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->run(pass, fail);
			};
			core_copy(pass, sub_fail);
		});
	}

	/** Ev::Io<a>::run
	 *
	 * @brief execute the action, calling exactly one of
	 * `pass` or `fail` exactly once.
	 */
	void run(PassF pass, FailF fail) const {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass](auto&&... value) {
			if (*completed)
				return;
			*completed = true;
			pass(std::forward<decltype(value)>(value)...);
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (*completed)
				return;
			*completed = true;
			fail(std::move(e));
		};
		try {
			core(PassF(std::move(sub_pass)), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	typedef typename Detail::IoBase<a>::PassF PassF;
	typedef typename Detail::IoBase<a>::FailF FailF;

	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::invoke_result<f, a>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::invoke_result<f, a>::type>::type;
		auto core_copy = this->core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , FailF fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next = Util::make_unique<Io<b>>(
						func(std::move(value))
					);
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->run(pass, fail);
			};
			core_copy(sub_pass, fail);
		});
	}
};

/* Separate then-implementation for Io<void>.  */
template<>
class Io<void> : public Detail::IoBase<void> {
public:
	Io(typename Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::invoke_result<f>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::invoke_result<f>::type>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , FailF fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next = Util::make_unique<Io<b>>(
						func()
					);
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->run(pass, fail);
			};
			core_copy(sub_pass, fail);
		});
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		pass();
	});
}

/* Sequence two actions.  */
inline
Io<void> operator+(Io<void> first, Io<void> second) {
	return first.then([second]() {
		return second;
	});
}
inline
Io<void>& operator+=(Io<void>& first, Io<void> second) {
	first = first + std::move(second);
	return first;
}

}

#endif /* !defined(EV_IO_HPP) */
