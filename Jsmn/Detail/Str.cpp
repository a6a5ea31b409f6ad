#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/ParseError.hpp"
#include"Util/Str.hpp"
#include<cstdint>
#include<iomanip>
#include<locale>
#include<sstream>

namespace {

std::uint32_t read_u4(std::string const& s, std::size_t& i) {
	if (s.size() - i < 4)
		throw Jsmn::ParseError("truncated \\u escape");
	auto digits = s.substr(i, 4);
	if (!Util::Str::ishex(digits))
		throw Jsmn::ParseError("bad \\u escape");
	i += 4;
	return std::uint32_t(std::stoul(digits, nullptr, 16));
}

void put_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out.push_back(char(cp));
	} else if (cp < 0x800) {
		out.push_back(char(0xC0 | (cp >> 6)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(char(0xE0 | (cp >> 12)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(char(0xF0 | (cp >> 18)));
		out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	auto out = std::string();
	out.reserve(s.size());
	for (auto c : s) {
		switch (c) {
		case '"': out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		case '\b': out += "\\b"; break;
		case '\f': out += "\\f"; break;
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		default:
			if ((unsigned char) c < 0x20)
				out += Util::Str::fmt("\\u%04x", unsigned((unsigned char) c));
			else
				out.push_back(c);
		}
	}
	return out;
}

std::string from_escaped(std::string const& s) {
	auto out = std::string();
	out.reserve(s.size());
	auto i = std::size_t(0);
	while (i < s.size()) {
		auto c = s[i++];
		if (c != '\\') {
			out.push_back(c);
			continue;
		}
		if (i == s.size())
			throw Jsmn::ParseError("truncated escape");
		c = s[i++];
		switch (c) {
		case '"': out.push_back('"'); break;
		case '\\': out.push_back('\\'); break;
		case '/': out.push_back('/'); break;
		case 'b': out.push_back('\b'); break;
		case 'f': out.push_back('\f'); break;
		case 'n': out.push_back('\n'); break;
		case 'r': out.push_back('\r'); break;
		case 't': out.push_back('\t'); break;
		case 'u': {
			auto cp = read_u4(s, i);
			/* A high surrogate followed by a low one.  */
			if (0xD800 <= cp && cp < 0xDC00
			 && s.compare(i, 2, "\\u") == 0) {
				auto j = i + 2;
				auto lo = read_u4(s, j);
				if (0xDC00 <= lo && lo < 0xE000) {
					cp = 0x10000
					   + ((cp - 0xD800) << 10)
					   + (lo - 0xDC00)
					   ;
					i = j;
				}
			}
			put_utf8(out, cp);
			break;
		}
		default:
			throw Jsmn::ParseError("bad escape");
		}
	}
	return out;
}

double to_double(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto rv = double(0);
	is >> rv;
	return rv;
}
std::string from_double(double d) {
	auto os = std::ostringstream();
	os.imbue(std::locale::classic());
	os << std::setprecision(17) << d;
	return os.str();
}

}}}
