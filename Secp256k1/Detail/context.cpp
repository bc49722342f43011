#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<secp256k1.h>
#include<stdexcept>
#include<string>

namespace {

void on_illegal(char const* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("libsecp256k1: ") + msg
	);
}

secp256k1_context* make_context() {
	auto ctx = secp256k1_context_create(SECP256K1_CONTEXT_NONE);
	if (!ctx)
		throw Util::BacktraceException<std::runtime_error>(
			"libsecp256k1: could not create context"
		);
	secp256k1_context_set_illegal_callback(ctx, &on_illegal, nullptr);
	return ctx;
}

}

namespace Secp256k1 { namespace Detail {

secp256k1_context_struct* context() {
	/* Thread-safe initialization; workers may
	 * compile taproot nodes.  */
	static secp256k1_context* const ctx = make_context();
	return ctx;
}

}}
