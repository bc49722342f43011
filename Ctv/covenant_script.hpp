#ifndef CTV_COVENANT_SCRIPT_HPP
#define CTV_COVENANT_SCRIPT_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<vector>

namespace Sha256 { class Hash; }

namespace Ctv {

struct NotCovenantScript : public Util::BacktraceException<std::invalid_argument> {
	NotCovenantScript()
		: Util::BacktraceException<std::invalid_argument>(
			"Ctv::NotCovenantScript"
		  ) { }
};

/* `<32-byte hash> OP_CHECKTEMPLATEVERIFY OP_DROP OP_TRUE`  */
std::vector<std::uint8_t> covenant_script(Sha256::Hash const& commitment);

/* Extracts the hash from a script built by
 * `covenant_script`; throws `NotCovenantScript`
 * on any other script.  */
Sha256::Hash covenant_commitment(std::vector<std::uint8_t> const& script);

}

#endif /* !defined(CTV_COVENANT_SCRIPT_HPP) */
