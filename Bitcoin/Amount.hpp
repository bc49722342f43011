#ifndef BITCOIN_AMOUNT_HPP
#define BITCOIN_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Bitcoin {

/** class Bitcoin::Amount
 *
 * @brief represents some amount of Bitcoins,
 * to satoshi precision.
 *
 * @desc Arithmetic saturates instead of
 * wrapping around.
 */
class Amount {
private:
	/* In satoshi.  */
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	/* Accepts a decimal number of satoshis,
	 * optionally with a `sat` suffix.  */
	explicit
	Amount(std::string const&);
	/* Outputs with the `sat` suffix.  */
	explicit
	operator std::string() const;
	static
	bool valid_string(std::string const&);

	static
	Amount sat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}
	/* Rounds to the nearest satoshi; negative
	 * values give zero.  */
	static
	Amount btc(double v);

	/* 21 million BTC, the most any output or
	 * transaction may carry.  */
	static
	Amount max_money() {
		return sat(2100000000000000ULL);
	}

	std::uint64_t to_sat() const {
		return v;
	}
	/* Fixed 8-decimal form, as taken by
	 * bitcoind amount parameters.  */
	std::string to_btc_string() const;

	Amount& operator+=(Amount const& i) {
		v += i.v;
		if (v < i.v)
			v = UINT64_MAX;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	Amount& operator-=(Amount const& i) {
		if (i.v > v)
			v = 0;
		else
			v -= i.v;
		return *this;
	}
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}
	Amount& operator*=(std::uint64_t i) {
		if (i != 0 && v > UINT64_MAX / i)
			v = UINT64_MAX;
		else
			v *= i;
		return *this;
	}
	Amount operator*(std::uint64_t i) const {
		return Amount(*this) *= i;
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator>(Amount const& o) const {
		return o < (*this);
	}
	bool operator<=(Amount const& o) const {
		return !(*this > o);
	}
	bool operator>=(Amount const& o) const {
		return o <= (*this);
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}
};

inline
Amount operator*(std::uint64_t i, Amount v) {
	return v * i;
}

inline
std::ostream& operator<<(std::ostream& os, Amount const& v) {
	return os << std::string(v);
}

}

#endif /* !defined(BITCOIN_AMOUNT_HPP) */
