#ifndef BITCOIN_LE_HPP
#define BITCOIN_LE_HPP

#include"Bitcoin/Amount.hpp"
#include<cstddef>
#include<cstdint>
#include<iostream>

namespace Bitcoin { namespace Detail {

/* Raw byte I/O shared by every width.  Reads are
 * unformatted; a short read sets failbit.  */
void put_le(std::ostream&, std::uint64_t v, std::size_t width);
std::uint64_t get_le(std::istream&, std::size_t width);

template<typename t>
struct LeTraits;
template<>
struct LeTraits<std::uint32_t> {
	static constexpr std::size_t width = 4;
	static std::uint64_t to(std::uint32_t v) { return v; }
	static std::uint32_t from(std::uint64_t v) { return std::uint32_t(v); }
};
template<>
struct LeTraits<std::uint64_t> {
	static constexpr std::size_t width = 8;
	static std::uint64_t to(std::uint64_t v) { return v; }
	static std::uint64_t from(std::uint64_t v) { return v; }
};
/* Amounts are serialized as 64-bit satoshi counts.  */
template<>
struct LeTraits<Bitcoin::Amount> {
	static constexpr std::size_t width = 8;
	static std::uint64_t to(Bitcoin::Amount v) { return v.to_sat(); }
	static Bitcoin::Amount from(std::uint64_t v) {
		return Bitcoin::Amount::sat(v);
	}
};

template<typename t>
class LeConst {
private:
	t v;

public:
	explicit
	LeConst(t const& v_) : v(v_) { }

	friend
	std::ostream& operator<<(std::ostream& os, LeConst o) {
		put_le(os, LeTraits<t>::to(o.v), LeTraits<t>::width);
		return os;
	}
};

template<typename t>
class Le {
private:
	t& v;

public:
	explicit
	Le(t& v_) : v(v_) { }

	friend
	std::istream& operator>>(std::istream& is, Le o) {
		o.v = LeTraits<t>::from(get_le(is, LeTraits<t>::width));
		return is;
	}
	friend
	std::ostream& operator<<(std::ostream& os, Le o) {
		return os << LeConst<t>(o.v);
	}
};

}}

namespace Bitcoin {

/** Bitcoin::le
 *
 * @brief wraps a 32-bit or 64-bit unsigned
 * integer, or an amount, so that it goes
 * through a stream in little-endian form.
 *
 * @desc
 *
 *     hasher << Bitcoin::le(tx.version);
 *     is >> Bitcoin::le(out.amount);
 */
inline
Detail::Le<std::uint32_t> le(std::uint32_t& v) {
	return Detail::Le<std::uint32_t>(v);
}
inline
Detail::LeConst<std::uint32_t> le(std::uint32_t const& v) {
	return Detail::LeConst<std::uint32_t>(v);
}
inline
Detail::Le<std::uint64_t> le(std::uint64_t& v) {
	return Detail::Le<std::uint64_t>(v);
}
inline
Detail::LeConst<std::uint64_t> le(std::uint64_t const& v) {
	return Detail::LeConst<std::uint64_t>(v);
}
inline
Detail::Le<Bitcoin::Amount> le(Bitcoin::Amount& v) {
	return Detail::Le<Bitcoin::Amount>(v);
}
inline
Detail::LeConst<Bitcoin::Amount> le(Bitcoin::Amount const& v) {
	return Detail::LeConst<Bitcoin::Amount>(v);
}

}

#endif /* !defined(BITCOIN_LE_HPP) */
