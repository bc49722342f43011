#ifndef SHA256_FUN_HPP
#define SHA256_FUN_HPP

#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include<cstddef>
#include<cstdint>
#include<vector>

namespace Sha256 {

/** Sha256::fun
 *
 * @brief one-shot SHA256 of a buffer, a byte
 * vector, or another digest (for double-SHA256).
 */
inline
Sha256::Hash fun(void const* p, std::size_t size) {
	auto h = Sha256::Hasher();
	h.feed(p, size);
	return std::move(h).finalize();
}
inline
Sha256::Hash fun(std::vector<std::uint8_t> const& bytes) {
	return fun(bytes.data(), bytes.size());
}
inline
Sha256::Hash fun(Sha256::Hash const& digest) {
	std::uint8_t b[32];
	digest.to_buffer(b);
	return fun(b, sizeof(b));
}

}

#endif /* !defined(SHA256_FUN_HPP) */
