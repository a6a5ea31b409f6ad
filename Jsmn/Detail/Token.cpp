#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/ParseError.hpp"

/* jsmn.h carries its implementation; instantiate it here only.  */
#define JSMN_STATIC 1
#undef JSMN_HEADER
#define JSMN_PARENT_LINKS 1
#define JSMN_STRICT 1
# include <jsmn.h>

namespace {

Jsmn::Detail::Type convert(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	default: return Jsmn::Detail::Undefined;
	}
}

}

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	auto b = i < 8 ? 0 : i - 8;
	auto context = i < input.size()
		     ? input.substr(b, 16)
		     : std::string("<end of input>")
		     ;
	return "Jsmn::ParseError: at offset " + std::to_string(i)
	     + " near `" + context + "`"
	     ;
}

namespace Detail {

void Token::skip(Token const*& tokptr) {
	auto n = tokptr->size;
	auto type = tokptr->type;
	++tokptr;
	if (type == Object) {
		for (auto i = 0; i < n; ++i) {
			/* The key is a plain string.  */
			++tokptr;
			skip(tokptr);
		}
	} else if (type == Array) {
		for (auto i = 0; i < n; ++i)
			skip(tokptr);
	}
}

std::shared_ptr<Parsed> tokenize(std::string const& text) {
	auto rv = std::make_shared<Parsed>();
	/* In strict mode a bare primitive needs something after
	 * it to end.
	 */
	rv->text = text + "\n";

	auto toks = std::vector<jsmntok_t>(16);
	auto res = int();
	auto parser = jsmn_parser();
	for (;;) {
		jsmn_init(&parser);
		res = jsmn_parse( &parser
				, rv->text.data(), rv->text.size()
				, &toks[0], toks.size()
				);
		if (res != JSMN_ERROR_NOMEM)
			break;
		toks.resize(toks.size() * 2);
	}
	if (res < 0)
		throw ParseError(text, parser.pos);
	if (res == 0)
		throw ParseError("no JSON datum");

	rv->tokens.resize(res);
	for (auto i = 0; i < res; ++i) {
		auto& t = rv->tokens[i];
		t.type = convert(toks[i].type);
		t.start = toks[i].start;
		t.end = toks[i].end;
		t.size = toks[i].size;
	}

	Token const* first = &rv->tokens[0];
	Token const* after = first;
	Token::skip(after);
	if (after - first != res)
		throw ParseError("more than one JSON datum");

	return rv;
}

}

}
