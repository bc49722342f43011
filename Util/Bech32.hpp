#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** enum Util::Bech32::Encoding
 *
 * @brief which checksum constant a string
 * validated against.
 *
 * @desc BIP-173 `bech32` is used for segwit
 * version 0 programs, BIP-350 `bech32m` for
 * version 1 and above.
 */
enum class Encoding {
	Invalid,
	Bech32,
	Bech32m
};

/** Util::Bech32::decode
 *
 * @brief decode a bech32 or bech32m string,
 * verifying its checksum.
 *
 * @return the encoding the checksum matched,
 * or `Encoding::Invalid` if the string is
 * malformed, has mixed case, or fails the
 * checksum.
 *
 * @desc On success `hrp` is the lowercased
 * human-readable part and `data` holds the
 * 5-bit values between the separator and
 * the checksum.
 */
Encoding decode( std::string& hrp
	       , std::vector<std::uint8_t>& data
	       , std::string const& bech32
	       );

/** Util::Bech32::encode
 *
 * @brief encode 5-bit values under the given
 * human-readable part and checksum variant.
 *
 * @desc Throws `std::invalid_argument` if a
 * value does not fit in 5 bits, the hrp is
 * unprintable, or the result would exceed 90
 * characters.
 */
std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& data
		  , Encoding encoding
		  );

/** Util::Bech32::convert_bits
 *
 * @brief regroup a sequence of `from`-bit
 * values into `to`-bit values.
 *
 * @return false if an input value is out of
 * range, or if `pad` is false and the input
 * leaves non-zero or over-long padding.
 */
bool convert_bits( std::vector<std::uint8_t>& out
		 , std::vector<std::uint8_t> const& in
		 , unsigned int from
		 , unsigned int to
		 , bool pad
		 );

}}

#endif /* !defined(UTIL_BECH32_HPP) */
