#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<memory>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief incremental SHA-256 over libsodium's
 * hash state.
 *
 * @desc Feed any number of byte runs, then
 * `std::move(hasher).finalize()`.
 * A finalized or moved-from hasher is invalid
 * (`!hasher`); the state is wiped when it goes.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	~Hasher();
	/* Copies the midstate, so a common prefix is
	 * hashed once.  */
	Hasher(Hasher const&);

	Hasher& operator=(Hasher&&);
	Hasher& operator=(Hasher const&);

	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	void feed(void const* p, std::size_t size);

	Sha256::Hash finalize()&&;
	/* Hash of what was fed so far, leaving the hasher
	 * usable; costs a copy of the state.  */
	Sha256::Hash get() const;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
