#ifndef CTV_TEMPLATE_HPP
#define CTV_TEMPLATE_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>

namespace Bitcoin { struct Tx; }

namespace Ctv {

/** struct Ctv::Template
 *
 * @brief the fields of a transaction that a
 * BIP-119 `OP_CHECKTEMPLATEVERIFY` commits to.
 *
 * @desc The variable-length parts are already
 * reduced to their sha256 digests.
 * `scriptsigs_digest` is a null hash when
 * every input has an empty scriptSig, and is
 * then left out of the preimage entirely.
 */
struct Template {
	std::uint32_t version;
	std::uint32_t lock_time;
	Sha256::Hash scriptsigs_digest;
	std::uint32_t input_count;
	Sha256::Hash sequences_digest;
	std::uint32_t output_count;
	Sha256::Hash outputs_digest;
	std::uint32_t input_index;

	Template()
		: version(0), lock_time(0)
		, input_count(0), output_count(0)
		, input_index(0)
		{ }

	static
	Template from_tx(Bitcoin::Tx const& tx, std::uint32_t input_index);

	/* `DefaultCheckTemplateVerifyHash`.  */
	Sha256::Hash hash() const;

	bool operator==(Template const& o) const {
		return version == o.version
		    && lock_time == o.lock_time
		    && scriptsigs_digest == o.scriptsigs_digest
		    && input_count == o.input_count
		    && sequences_digest == o.sequences_digest
		    && output_count == o.output_count
		    && outputs_digest == o.outputs_digest
		    && input_index == o.input_index
		     ;
	}
	bool operator!=(Template const& o) const {
		return !(*this == o);
	}
};

inline
Sha256::Hash template_hash(Bitcoin::Tx const& tx, std::uint32_t input_index) {
	return Template::from_tx(tx, input_index).hash();
}

}

#endif /* !defined(CTV_TEMPLATE_HPP) */
