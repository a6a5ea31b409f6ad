#ifndef JSMN_DETAIL_TOKEN_HPP
#define JSMN_DETAIL_TOKEN_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail {

enum Type
{ Undefined = 0
, Object = 1
, Array = 2
, String = 3
, Primitive = 4
};

struct Token {
	Type type;
	/* Offsets into the text; strings exclude the quotes.  */
	int start;
	int end;
	/* Keys for objects, elements for arrays.  */
	int size;

	/* Advance past this token and all its children.  */
	static void skip(Token const*& tokptr);
};

/* A JSON text and its tokens, in document order.  */
struct Parsed {
	std::string text;
	std::vector<Token> tokens;
};

/** Jsmn::Detail::tokenize
 *
 * @brief runs jsmn over a text that must hold exactly
 * one JSON datum, surrounded by optional whitespace.
 *
 * @desc Throws Jsmn::ParseError on malformed text, on an
 * empty text, or on more than one datum.
 */
std::shared_ptr<Parsed> tokenize(std::string const& text);

}}

#endif /* !defined(JSMN_DETAIL_TOKEN_HPP) */
