#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Router/Mod/Waiter.hpp"
#include"Router/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<list>

namespace Router { namespace Mod {

class Waiter::Impl {
private:
	typedef std::function<void()> PassF;
	typedef std::function<void(std::exception_ptr)> FailF;

	bool is_shutting_down;

	/* Information structure for each timer.  */
	struct Info {
		Impl *pimpl;
		PassF pass;
		FailF fail;
		std::list<ev_timer>::iterator it;
	};
	std::list<ev_timer> timers;

	void shutdown() {
		is_shutting_down = true;
		/* Move the timers out of the current object and into
		 * a scoped variable.  */
		auto timers_copy = std::move(timers);
		timers.clear();

		for (auto& timer : timers_copy) {
			/* Reacquire control of the info structure.  */
			auto info = std::unique_ptr<Info>((Info*) timer.data);
			auto fail = std::move(info->fail);
			ev_timer_stop(EV_DEFAULT_ &timer);

			fail_shutdown(fail);
		}
	}

	static
	void fail_shutdown(FailF const& fail) {
		fail(std::make_exception_ptr(Router::Shutdown()));
	}

	static
	void timer_static_handler(EV_P_ ev_timer *timer, int revents) {
		/* Reacquire control of the info structure.  */
		auto info = std::unique_ptr<Info>((Info*)timer->data);
		auto pass = std::move(info->pass);
		ev_timer_stop(EV_A_ timer);
		info->pimpl->timers.erase(info->it);

		pass();
	}

	/* Starts a timer; the returned iterator stays valid
	 * until the timer fires, is cancelled, or a
	 * shutdown fails it.  */
	std::list<ev_timer>::iterator
	start_timer(double seconds, PassF pass, FailF fail) {
		auto it = timers.emplace(timers.begin(), ev_timer());
		ev_timer_init(&*it, &timer_static_handler, seconds, 0);
		auto info = Util::make_unique<Info>();
		info->pimpl = this;
		info->pass = std::move(pass);
		info->fail = std::move(fail);
		info->it = it;
		/* Release the info to the ev_timer.  */
		it->data = info.release();
		ev_timer_start(EV_DEFAULT_ &*it);
		return it;
	}
	void cancel_timer(std::list<ev_timer>::iterator it) {
		auto info = std::unique_ptr<Info>((Info*) it->data);
		ev_timer_stop(EV_DEFAULT_ &*it);
		timers.erase(it);
	}

public:
	explicit
	Impl(S::Bus& bus) {
		is_shutting_down = false;
		bus.subscribe<Router::Shutdown>([this](Router::Shutdown const& _) {
			shutdown();
			return Ev::lift();
		});
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([ this
				    , seconds
				    ]( PassF pass
				     , FailF fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);
			start_timer(seconds, std::move(pass), std::move(fail));
		});
	}

	struct TimedCoreData {
		PassF pass;
		FailF fail;
		/* Set once either the action or the timer
		 * has resolved the timed action.  */
		bool flag;
		bool timer_live;
		std::list<ev_timer>::iterator timer;
	};

	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action) {
		auto paction = std::make_shared<Ev::Io<void>>(
			std::move(action)
		);
		return Ev::Io<void>([ this
				    , timeout
				    , paction
				    ]( PassF pass
				     , FailF fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);

			auto sh = std::make_shared<TimedCoreData>();
			sh->pass = std::move(pass);
			sh->fail = std::move(fail);
			sh->flag = false;
			sh->timer_live = false;

			auto resolve_fail = [sh](std::exception_ptr e) {
				if (sh->flag)
					return;
				sh->flag = true;
				auto fail = std::move(sh->fail);
				sh->pass = nullptr;
				fail(e);
			};
			auto stop_timer = [this, sh]() {
				if (!sh->timer_live)
					return;
				sh->timer_live = false;
				cancel_timer(sh->timer);
			};

			sh->timer = start_timer(timeout, [sh, resolve_fail]() {
				sh->timer_live = false;
				resolve_fail(std::make_exception_ptr(TimedOut{}));
			}, [sh, resolve_fail](std::exception_ptr e) {
				sh->timer_live = false;
				resolve_fail(e);
			});
			sh->timer_live = true;

			paction->run([sh, stop_timer]() {
				if (sh->flag)
					return;
				sh->flag = true;
				stop_timer();
				auto pass = std::move(sh->pass);
				sh->fail = nullptr;
				pass();
			}, [sh, stop_timer, resolve_fail](std::exception_ptr e) {
				if (sh->flag)
					return;
				stop_timer();
				resolve_fail(e);
			});
		}).then([]() {
			return Ev::yield();
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) {}
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
Ev::Io<void> Waiter::timed_core(double timeout, Ev::Io<void> action) {
	return pimpl->timed_core(timeout, std::move(action));
}

}}
