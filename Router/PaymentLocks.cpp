#include"Router/PaymentLocks.hpp"

namespace Router {

PaymentLocks::Lock PaymentLocks::try_acquire(Sha256::Hash const& hash) {
	auto l = std::unique_lock<std::mutex>(mut);
	if (!held.insert(hash).second)
		return Lock();
	return Lock(this, hash);
}
bool PaymentLocks::is_held(Sha256::Hash const& hash) {
	auto l = std::unique_lock<std::mutex>(mut);
	return held.count(hash) != 0;
}
void PaymentLocks::release(Sha256::Hash const& hash) {
	auto l = std::unique_lock<std::mutex>(mut);
	held.erase(hash);
}

}
