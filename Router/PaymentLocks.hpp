#ifndef ROUTER_PAYMENTLOCKS_HPP
#define ROUTER_PAYMENTLOCKS_HPP

#include"Sha256/Hash.hpp"
#include<memory>
#include<mutex>
#include<unordered_set>

namespace Router {

/** class Router::PaymentLocks
 *
 * @brief registry of the payment hashes that have a
 * running attempt loop.
 *
 * @desc A hash is held for as long as the Lock
 * returned by `try_acquire` lives (or until it is
 * released); a second acquisition of a held hash
 * fails immediately instead of waiting.
 * The registry must outlive its locks.
 */
class PaymentLocks {
private:
	std::mutex mut;
	std::unordered_set<Sha256::Hash> held;

	void release(Sha256::Hash const& hash);

public:
	class Lock {
	private:
		PaymentLocks* locks;
		Sha256::Hash hash;

		friend class PaymentLocks;
		Lock(PaymentLocks* locks_, Sha256::Hash hash_)
			: locks(locks_), hash(std::move(hash_)) { }

	public:
		/* An empty lock, holding nothing.  */
		Lock() : locks(nullptr), hash() { }
		Lock(Lock&& o) : locks(o.locks), hash(std::move(o.hash)) {
			o.locks = nullptr;
		}
		Lock& operator=(Lock&& o) {
			if (this == &o)
				return *this;
			release();
			locks = o.locks;
			hash = std::move(o.hash);
			o.locks = nullptr;
			return *this;
		}
		Lock(Lock const&) =delete;
		Lock& operator=(Lock const&) =delete;
		~Lock() { release(); }

		explicit
		operator bool() const { return locks != nullptr; }
		bool operator!() const { return locks == nullptr; }

		/* Releases early; harmless if already empty.  */
		void release() {
			if (!locks)
				return;
			locks->release(hash);
			locks = nullptr;
		}
	};

	PaymentLocks() =default;
	PaymentLocks(PaymentLocks const&) =delete;

	/* Returns an empty Lock if the hash is already
	 * held.  */
	Lock try_acquire(Sha256::Hash const& hash);
	bool is_held(Sha256::Hash const& hash);
};

}

#endif /* !defined(ROUTER_PAYMENTLOCKS_HPP) */
