#include"Util/Str.hpp"
#include<algorithm>
#include<cctype>
#include<cstdio>
#include<vector>

namespace Util {
namespace Str {

namespace {

auto const hexdigits = "0123456789abcdef";

std::uint8_t parse_nibble(char c) {
	if ('0' <= c && c <= '9')
		return std::uint8_t(c - '0');
	if ('a' <= c && c <= 'f')
		return std::uint8_t(c - 'a' + 10);
	if ('A' <= c && c <= 'F')
		return std::uint8_t(c - 'A' + 10);
	throw HexParseFailure(std::string("Non-hex character: ") + c);
}

bool is_nibble(char c) {
	return ('0' <= c && c <= '9')
	    || ('a' <= c && c <= 'f')
	    || ('A' <= c && c <= 'F')
	     ;
}

}

std::string hexbyte(std::uint8_t v) {
	auto rv = std::string(2, '0');
	rv[0] = hexdigits[v >> 4];
	rv[1] = hexdigits[v & 0xF];
	return rv;
}

std::string hexdump(void const* vp, std::size_t s) {
	auto p = (std::uint8_t const*) vp;
	auto rv = std::string();
	rv.reserve(s * 2);
	for (auto i = std::size_t(0); i < s; ++i) {
		rv.push_back(hexdigits[p[i] >> 4]);
		rv.push_back(hexdigits[p[i] & 0xF]);
	}
	return rv;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto rv = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < rv.size(); ++i)
		rv[i] = (parse_nibble(s[2 * i]) << 4)
		      | parse_nibble(s[2 * i + 1])
		      ;
	return rv;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), is_nibble);
}

std::string trim(std::string const& s) {
	auto start = std::find_if_not(s.begin(), s.end(), ::isspace);
	if (start == s.end())
		return "";
	auto end = std::find_if_not(s.rbegin(), s.rend(), ::isspace).base();
	return std::string(start, end);
}

std::string tolower(std::string s) {
	for (auto& c : s)
		if ('A' <= c && c <= 'Z')
			c = char(c - 'A' + 'a');
	return s;
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	auto buf = std::vector<char>(64);
	for (;;) {
		va_copy(ap, ap_orig);
		auto written = vsnprintf(&buf[0], buf.size(), tpl, ap);
		va_end(ap);
		if (written < 0)
			return std::string(tpl);
		if (std::size_t(written) < buf.size())
			return std::string(&buf[0], std::size_t(written));
		buf.resize(std::size_t(written) + 1);
	}
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}}
