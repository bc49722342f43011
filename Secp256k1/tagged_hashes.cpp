#include"Secp256k1/tagged_hashes.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/HasherStream.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Tag {

namespace {

const char *taptagstrings[3] = {
	"TapLeaf",
	"TapBranch",
	"TapTweak"
};

}

const char* str(Tag::tap tag) {
	auto i = static_cast<std::uint8_t>(tag);
	if (i >= 3)
		throw Util::BacktraceException<std::invalid_argument>(
			"Tag::str: unknown tag"
		);
	return taptagstrings[i];
}

}

namespace Secp256k1 {

Sha256::Hash tagged_hash( Tag::tap tag
			, std::vector<std::uint8_t> const& input
			) {
	auto hasher = Sha256::HasherStream(Tag::str(tag));
	hasher.write( reinterpret_cast<char const*>(input.data())
		    , input.size()
		    );
	return std::move(hasher).finalize();
}

void tagged_hash( std::uint8_t output[32]
		, std::uint8_t const input[]
		, std::size_t inputsize
		, Tag::tap tag
		) {
	auto hasher = Sha256::HasherStream(Tag::str(tag));
	hasher.write(reinterpret_cast<char const*>(input), inputsize);
	std::move(hasher).finalize().to_buffer(output);
}

}
