#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<secp256k1.h>
#include<sodium/randombytes.h>
#include<sodium/utils.h>
#include<stdexcept>
#include<string>

namespace {

void illegal_callback(char const* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("secp256k1: ") + msg
	);
}

typedef std::unique_ptr< secp256k1_context
		       , void (*)(secp256k1_context*)
		       > Owner;

Owner create() {
	auto ctx = Owner( secp256k1_context_create(SECP256K1_CONTEXT_NONE)
			, &secp256k1_context_destroy
			);
	secp256k1_context_set_illegal_callback( ctx.get()
					      , &illegal_callback
					      , nullptr
					      );
	/* Blinding against side channels while signing.  */
	unsigned char seed[32];
	randombytes_buf(seed, sizeof(seed));
	auto ok = secp256k1_context_randomize(ctx.get(), seed);
	sodium_memzero(seed, sizeof(seed));
	if (!ok)
		throw Util::BacktraceException<std::runtime_error>(
			"secp256k1: context randomization failed"
		);
	return ctx;
}

}

namespace Secp256k1 { namespace Detail {

secp256k1_context_struct* context() {
	static Owner const ctx = create();
	return ctx.get();
}

}}
