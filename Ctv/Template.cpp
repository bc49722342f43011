#include"Bitcoin/Tx.hpp"
#include"Bitcoin/le.hpp"
#include"Bitcoin/varint.hpp"
#include"Ctv/Template.hpp"
#include"Sha256/HasherStream.hpp"
#include<algorithm>

namespace Ctv {

Template Template::from_tx(Bitcoin::Tx const& tx, std::uint32_t input_index) {
	auto rv = Template();
	rv.version = tx.version;
	rv.lock_time = tx.locktime;
	rv.input_count = std::uint32_t(tx.inputs.size());
	rv.output_count = std::uint32_t(tx.outputs.size());
	rv.input_index = input_index;

	auto any_scriptsig = std::any_of( tx.inputs.begin(), tx.inputs.end()
					, [](Bitcoin::TxIn const& i) {
		return !i.script_sig.empty();
	});
	if (any_scriptsig) {
		auto h = Sha256::HasherStream();
		for (auto const& i : tx.inputs)
			Bitcoin::write_prefixed(h, i.script_sig);
		rv.scriptsigs_digest = std::move(h).finalize();
	}

	{
		auto h = Sha256::HasherStream();
		for (auto const& i : tx.inputs)
			h << Bitcoin::le(i.sequence);
		rv.sequences_digest = std::move(h).finalize();
	}
	{
		auto h = Sha256::HasherStream();
		for (auto const& o : tx.outputs)
			h << o;
		rv.outputs_digest = std::move(h).finalize();
	}

	return rv;
}

Sha256::Hash Template::hash() const {
	auto h = Sha256::HasherStream();
	std::uint8_t buf[32];

	h << Bitcoin::le(version)
	  << Bitcoin::le(lock_time)
	   ;
	if (scriptsigs_digest) {
		scriptsigs_digest.to_buffer(buf);
		h.write(reinterpret_cast<char const*>(buf), sizeof(buf));
	}
	h << Bitcoin::le(input_count);
	sequences_digest.to_buffer(buf);
	h.write(reinterpret_cast<char const*>(buf), sizeof(buf));
	h << Bitcoin::le(output_count);
	outputs_digest.to_buffer(buf);
	h.write(reinterpret_cast<char const*>(buf), sizeof(buf));
	h << Bitcoin::le(input_index);

	return std::move(h).finalize();
}

}
