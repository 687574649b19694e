#ifndef LN_BE_HPP
#define LN_BE_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<iostream>

namespace Ln { namespace Detail { class Be16; }}
namespace Ln { namespace Detail { class Be16Const; }}
namespace Ln { namespace Detail { class Be32; }}
namespace Ln { namespace Detail { class Be32Const; }}
namespace Ln { namespace Detail { class Be64; }}
namespace Ln { namespace Detail { class Be64Const; }}
namespace Ln { namespace Detail { class BeAmount; }}
namespace Ln { namespace Detail { class BeAmountConst; }}

namespace Ln {

/** Ln::be
 *
 * @brief wraps a uint16, uint32, uint64, or
 * `Ln::Amount` (as millisatoshi) so it is encoded
 * in the big-endian form used by Lightning Network
 * wire messages.
 *
 * @desc intended use is:
 *
 *     os << Ln::be(expr);
 *     is >> Ln::be(var);
 *
 * Reading past the end of input sets the stream's
 * failbit.
 */
Detail::Be16 be(std::uint16_t& v);
Detail::Be16Const be(std::uint16_t const& v);
Detail::Be32 be(std::uint32_t& v);
Detail::Be32Const be(std::uint32_t const& v);
Detail::Be64 be(std::uint64_t& v);
Detail::Be64Const be(std::uint64_t const& v);
Detail::BeAmount be(Ln::Amount& v);
Detail::BeAmountConst be(Ln::Amount const& v);

}

namespace Ln { namespace Detail {

std::ostream& operator<<(std::ostream&, Be16Const);
std::ostream& operator<<(std::ostream&, Be32Const);
std::ostream& operator<<(std::ostream&, Be64Const);
std::ostream& operator<<(std::ostream&, BeAmountConst);
std::istream& operator>>(std::istream&, Be16);
std::istream& operator>>(std::istream&, Be32);
std::istream& operator>>(std::istream&, Be64);
std::istream& operator>>(std::istream&, BeAmount);

}}

namespace Ln { namespace Detail {

class Be16Const {
private:
	std::uint16_t v;

	friend
	std::ostream& operator<<(std::ostream&, Be16Const);

public:
	Be16Const(std::uint16_t const& v_) : v(v_) { }
};

class Be16 {
private:
	std::uint16_t& v;

	friend
	std::istream& operator>>(std::istream&, Be16);

public:
	Be16(std::uint16_t& v_) : v(v_) { }
	operator Be16Const() const { return Be16Const(v); }
};

class Be32Const {
private:
	std::uint32_t v;

	friend
	std::ostream& operator<<(std::ostream&, Be32Const);

public:
	Be32Const(std::uint32_t const& v_) : v(v_) { }
};

class Be32 {
private:
	std::uint32_t& v;

	friend
	std::istream& operator>>(std::istream&, Be32);

public:
	Be32(std::uint32_t& v_) : v(v_) { }
	operator Be32Const() const { return Be32Const(v); }
};

class Be64Const {
private:
	std::uint64_t v;

	friend
	std::ostream& operator<<(std::ostream&, Be64Const);

public:
	Be64Const(std::uint64_t const& v_) : v(v_) { }
};

class Be64 {
private:
	std::uint64_t& v;

	friend
	std::istream& operator>>(std::istream&, Be64);

public:
	Be64(std::uint64_t& v_) : v(v_) { }
	operator Be64Const() const { return Be64Const(v); }
};

class BeAmountConst {
private:
	Ln::Amount v;

	friend
	std::ostream& operator<<(std::ostream&, BeAmountConst);

public:
	BeAmountConst(Ln::Amount const& v_) : v(v_) { }
};

class BeAmount {
private:
	Ln::Amount& v;

	friend
	std::istream& operator>>(std::istream&, BeAmount);

public:
	BeAmount(Ln::Amount& v_) : v(v_) { }
	operator BeAmountConst() const { return BeAmountConst(v); }
};

}}

#endif /* !defined(LN_BE_HPP) */
