#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>

namespace S { namespace Detail {

/* Registers callbacks for a particular type a, and
 * broadcasts to all callbacks.  */
template<typename a>
class Signal : public SignalBase {
private:
	/* Singly-linked list, so that callbacks subscribed
	 * while a raise is in progress are safely appended.  */
	struct Node {
		std::function<Ev::Io<void>(a const&)> callback;
		std::shared_ptr<Node> next;
	};
	std::shared_ptr<Node> first;
	Node* last;
	std::size_t count;

public:
	Signal() : first(), last(nullptr), count(0) { }

	std::size_t size() const override { return count; }

private:
	/* State shared by all the greenthreads of one raise.
	 * The raise completes once every callback has
	 * completed; the first exception thrown by any
	 * callback is what the raise fails with.  */
	struct RaiseData {
		std::unique_ptr<a> value;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
		std::exception_ptr exc;
		bool starting;
		std::size_t running;

		explicit
		RaiseData(a value_
			 ) : value(Util::make_unique<a>(std::move(value_)))
			   , pass(nullptr)
			   , fail(nullptr)
			   , exc(nullptr)
			   , starting(true)
			   , running(0)
			   { }

		void finish_startup() {
			starting = false;
			if (running == 0)
				trigger();
		}
		void finish_callback(std::exception_ptr e) {
			if (e && !exc)
				exc = e;
			--running;
			if (!starting && running == 0)
				trigger();
		}
		void trigger() {
			value = nullptr;
			if (exc) {
				pass = nullptr;
				fail(exc);
			} else {
				fail = nullptr;
				pass();
			}
		}
	};

	static
	Ev::Io<void> wait_all(std::shared_ptr<RaiseData> pdata) {
		return Ev::Io<void>([ pdata
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			pdata->pass = std::move(pass);
			pdata->fail = std::move(fail);
			pdata->finish_startup();
		});
	}

	static
	Ev::Io<void> launch( std::shared_ptr<RaiseData> pdata
			   , std::shared_ptr<Node> it
			   ) {
		++pdata->running;
		return Ev::concurrent(Ev::Io<void>([ pdata, it
						   ]( std::function<void()> pass
						    , std::function<void(std::exception_ptr)> _
						    ) {
			auto action = Ev::lift().then([pdata, it]() {
				return it->callback(*pdata->value);
			});
			action.run([pdata, pass]() {
				pass();
				pdata->finish_callback(nullptr);
			}, [pdata, pass](std::exception_ptr e) {
				pass();
				pdata->finish_callback(e);
			});
		}));
	}

	static
	Ev::Io<void> raise_loop( std::shared_ptr<RaiseData> pdata
			       , std::shared_ptr<Node> it
			       ) {
		if (!it)
			return wait_all(std::move(pdata)).then([]() {
				return Ev::yield();
			});

		return Ev::yield().then([pdata, it]() {
			return launch(pdata, it);
		}).then([pdata, it]() {
			return raise_loop(pdata, it->next);
		});
	}

public:
	/* `a` must be at least movable.
	 * Messages are expected to be plain data structures.
	 */
	Ev::Io<void> raise(a value) {
		auto pdata = std::make_shared<RaiseData>(std::move(value));
		return raise_loop(std::move(pdata), first);
	}

	void subscribe(std::function<Ev::Io<void>(a const&)> callback) {
		if (!callback)
			return;
		auto nnode = std::make_shared<Node>();
		nnode->callback = std::move(callback);
		if (last) {
			last->next = std::move(nnode);
			last = last->next.get();
		} else {
			first = std::move(nnode);
			last = first.get();
		}
		++count;
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
