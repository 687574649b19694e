#ifndef LN_PREIMAGE_HPP
#define LN_PREIMAGE_HPP

#include<cstdint>
#include<cstring>
#include<memory>
#include<string>

namespace Sha256 { class Hash; }

namespace Ln {

/** class Ln::Preimage
 *
 * @brief a preimage for a payment hash, revealed
 * by the payee when a payment succeeds.
 */
class Preimage {
private:
	struct Impl {
		std::uint8_t data[32];
	};
	std::shared_ptr<Impl> pimpl;

public:
	Preimage() =default;
	Preimage(Preimage const&) =default;
	Preimage(Preimage&&) =default;
	Preimage& operator=(Preimage const&) =default;
	Preimage& operator=(Preimage&&) =default;
	~Preimage() =default;

	static
	bool valid_string(std::string const&);
	explicit
	Preimage(std::string const&);

	explicit
	operator std::string() const;

	bool operator==(Preimage const&) const;
	bool operator!=(Preimage const& o) const {
		return !(*this == o);
	}

	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	void to_buffer(std::uint8_t data[32]) const {
		if (pimpl)
			std::memcpy(data, pimpl->data, 32);
		else
			std::memset(data, 0, 32);
	}
	void from_buffer(std::uint8_t const data[32]) {
		pimpl = std::make_shared<Impl>();
		std::memcpy(pimpl->data, data, 32);
	}

	/* The payment hash this preimage unlocks.  */
	Sha256::Hash sha256() const;
};

}

#endif /* !defined(LN_PREIMAGE_HPP) */
