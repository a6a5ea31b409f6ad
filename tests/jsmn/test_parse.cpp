#undef NDEBUG
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include<assert.h>
#include<sstream>

namespace {

bool fails(std::string const& text) {
	try {
		(void) Jsmn::Object::parse_json(text);
	} catch (Jsmn::ParseError const&) {
		return true;
	}
	return false;
}

}

int main() {
	/* Bare primitives and surrounding whitespace.  */
	assert(double(Jsmn::Object::parse_json("42")) == 42);
	assert(Jsmn::Object::parse_json(" null\n").is_null());
	assert(bool(Jsmn::Object::parse_json("true")));
	assert(std::string(Jsmn::Object::parse_json("\"tark1q\"")) == "tark1q");

	assert(fails(""));
	assert(fails("   "));
	assert(fails("{\"a\": 1"));
	assert(fails("{\"a\" 1}"));
	assert(fails("[1, 2,]"));
	assert(fails("{} {}"));
	assert(fails("1 2"));
	assert(fails("nope"));

	/* A contract-shaped document, large enough to outgrow
	 * the initial token buffer.
	 */
	auto os = std::ostringstream();
	os << "{\"address\": \"tark1abc\", \"amounts\": [";
	for (auto i = 0; i < 100; ++i)
		os << (i ? "," : "") << i;
	os << "], \"buyer\": {\"name\": \"Alice\", \"pubKey\": [1, 2, 3]}"
	   << ", \"pendingTransaction\": null}";
	auto o = Jsmn::Object::parse_json(os.str());

	assert(o.is_object());
	assert(o.size() == 4);
	assert((o.keys() == std::vector<std::string>{ "address", "amounts"
						    , "buyer", "pendingTransaction"
						    }));
	assert(o.has("buyer"));
	assert(!o.has("seller"));
	assert(o["seller"].is_null());
	assert(o["pendingTransaction"].is_null());
	assert(!bool(o["pendingTransaction"]));

	auto amounts = o["amounts"];
	assert(amounts.is_array());
	assert(amounts.size() == 100);
	assert(double(amounts[99]) == 99);
	assert(amounts[100].is_null());

	/* Nested values are skipped over correctly.  */
	auto buyer = o["buyer"];
	assert(std::string(buyer["name"]) == "Alice");
	assert(buyer["pubKey"].size() == 3);
	assert(std::string(o["address"]) == "tark1abc");

	/* Wrong-type use.  */
	auto threw = false;
	try {
		(void) std::string(amounts);
	} catch (Jsmn::TypeError const&) {
		threw = true;
	}
	assert(threw);
	threw = false;
	try {
		(void) double(o["address"]);
	} catch (Jsmn::TypeError const&) {
		threw = true;
	}
	assert(threw);
	threw = false;
	try {
		(void) buyer.begin();
	} catch (Jsmn::TypeError const&) {
		threw = true;
	}
	assert(threw);

	/* Raw text of numbers, for exact integer checks.  */
	auto n = Jsmn::Object::parse_json("[1.5, -3, 1e3]");
	assert(n[0].direct_text() == "1.5");
	assert(n[1].direct_text() == "-3");
	assert(n[2].direct_text() == "1e3");

	/* Escapes.  */
	auto esc = Jsmn::Object::parse_json(R"JSON(["a\"b\\c\/", "\u00e9", "\ud83d\ude00", "\n\t"])JSON");
	assert(std::string(esc[0]) == "a\"b\\c/");
	assert(std::string(esc[1]) == "\xc3\xa9");
	assert(std::string(esc[2]) == "\xf0\x9f\x98\x80");
	assert(std::string(esc[3]) == "\n\t");
	assert(fails(R"JSON(["\q"])JSON"));
	threw = false;
	try {
		(void) std::string(Jsmn::Object::parse_json(R"JSON("\u12")JSON"));
	} catch (Jsmn::ParseError const&) {
		threw = true;
	}
	assert(threw);

	using Jsmn::Detail::Str::to_escaped;
	assert(to_escaped("say \"hi\"\n") == "say \\\"hi\\\"\\n");
	assert(to_escaped(std::string("\x01", 1)) == "\\u0001");

	return 0;
}
