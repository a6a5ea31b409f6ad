#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Object.hpp"
#include<ostream>

namespace Jsmn {

class Object::Impl {
private:
	std::shared_ptr<Detail::Parsed> parsed;
	std::size_t i;

	Detail::Token const& token() const {
		return parsed->tokens[i];
	}
	std::size_t index_of(Detail::Token const* tokptr) const {
		return tokptr - &parsed->tokens[0];
	}
	std::string text_of(Detail::Token const& tok) const {
		auto sb = parsed->text.cbegin();
		return std::string(sb + tok.start, sb + tok.end);
	}

	void require(Detail::Type t) const {
		if (token().type != t)
			throw TypeError();
	}

	/* Token of the value under the given key, or null.  */
	Detail::Token const* find_key(std::string const& s) const {
		require(Detail::Object);
		auto& tok = token();
		auto tokptr = &tok + 1;
		for (auto n = 0; n < tok.size; ++n) {
			auto key = Detail::Str::from_escaped(text_of(*tokptr));
			++tokptr;
			if (key == s)
				return tokptr;
			Detail::Token::skip(tokptr);
		}
		return nullptr;
	}

public:
	Impl( std::shared_ptr<Detail::Parsed> parsed_
	    , std::size_t i_
	    ) : parsed(std::move(parsed_)), i(i_) { }

	Detail::Type type() const {
		return token().type;
	}
	char first_char() const {
		return parsed->text[token().start];
	}

	explicit operator bool() const {
		require(Detail::Primitive);
		auto c = first_char();
		if (c == 'n' || c == 'f')
			return false;
		if (c == 't')
			return true;
		throw TypeError();
	}
	explicit operator std::string() const {
		require(Detail::String);
		return Detail::Str::from_escaped(text_of(token()));
	}
	explicit operator double() const {
		require(Detail::Primitive);
		auto c = first_char();
		if (c == 'n' || c == 'f' || c == 't')
			throw TypeError();
		return Detail::Str::to_double(text_of(token()));
	}

	std::string direct_text() const {
		return text_of(token());
	}

	std::size_t size() const {
		auto t = type();
		if (t != Detail::Array && t != Detail::Object)
			throw TypeError();
		return token().size;
	}

	std::vector<std::string> keys() const {
		require(Detail::Object);
		auto& tok = token();
		auto ret = std::vector<std::string>();
		auto tokptr = &tok + 1;
		for (auto n = 0; n < tok.size; ++n) {
			ret.push_back(Detail::Str::from_escaped(text_of(*tokptr)));
			++tokptr;
			Detail::Token::skip(tokptr);
		}
		return ret;
	}
	bool has(std::string const& s) const {
		return find_key(s) != nullptr;
	}
	std::shared_ptr<Impl> operator[](std::string const& s) const {
		auto tokptr = find_key(s);
		if (!tokptr)
			return nullptr;
		return std::make_shared<Impl>(parsed, index_of(tokptr));
	}

	std::shared_ptr<Impl> operator[](std::size_t n) const {
		require(Detail::Array);
		auto& tok = token();
		if (n >= std::size_t(tok.size))
			return nullptr;
		auto tokptr = &tok + 1;
		for (auto step = std::size_t(0); step < n; ++step)
			Detail::Token::skip(tokptr);
		return std::make_shared<Impl>(parsed, index_of(tokptr));
	}

	const_iterator begin() const {
		require(Detail::Array);
		return const_iterator(parsed, i + 1);
	}
	const_iterator end() const {
		require(Detail::Array);
		auto tokptr = &token();
		Detail::Token::skip(tokptr);
		return const_iterator(parsed, index_of(tokptr));
	}
};

Object::Object() : pimpl(nullptr) { }

Object::Object( std::shared_ptr<Detail::Parsed> parsed
	      , std::size_t i
	      ) : pimpl(std::make_shared<Impl>(std::move(parsed), i)) { }

Object Object::parse_json(std::string const& text) {
	return Object(Detail::tokenize(text), 0);
}

bool Object::is_null() const {
	if (!pimpl)
		return true;
	return pimpl->type() == Detail::Primitive && pimpl->first_char() == 'n';
}
bool Object::is_boolean() const {
	if (!pimpl)
		return false;
	auto c = pimpl->first_char();
	return pimpl->type() == Detail::Primitive && (c == 'f' || c == 't');
}
bool Object::is_string() const {
	return pimpl && pimpl->type() == Detail::String;
}
bool Object::is_object() const {
	return pimpl && pimpl->type() == Detail::Object;
}
bool Object::is_array() const {
	return pimpl && pimpl->type() == Detail::Array;
}
bool Object::is_number() const {
	if (!pimpl)
		return false;
	auto c = pimpl->first_char();
	return pimpl->type() == Detail::Primitive
	    && c != 't' && c != 'f' && c != 'n'
	     ;
}

Object::operator bool() const {
	if (!pimpl)
		return false;
	return bool(*pimpl);
}
Object::operator std::string() const {
	if (!pimpl)
		throw TypeError();
	return std::string(*pimpl);
}
Object::operator double() const {
	if (!pimpl)
		throw TypeError();
	return double(*pimpl);
}

std::size_t Object::size() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->size();
}
std::vector<std::string> Object::keys() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->keys();
}
bool Object::has(std::string const& s) const {
	if (!pimpl)
		throw TypeError();
	return pimpl->has(s);
}
Object Object::operator[](std::string const& s) const {
	if (!pimpl)
		throw TypeError();
	auto ret = Object();
	ret.pimpl = (*pimpl)[s];
	return ret;
}
Object Object::operator[](std::size_t n) const {
	if (!pimpl)
		throw TypeError();
	auto ret = Object();
	ret.pimpl = (*pimpl)[n];
	return ret;
}

std::string Object::direct_text() const {
	if (!pimpl)
		return "null";
	return pimpl->direct_text();
}

Object::const_iterator Object::begin() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->begin();
}
Object::const_iterator Object::end() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->end();
}

Object Object::const_iterator::operator*() const {
	return Object(parsed, i);
}
Object::const_iterator& Object::const_iterator::operator++() {
	Detail::Token const* tokptr = &parsed->tokens[i];
	Detail::Token::skip(tokptr);
	i = tokptr - &parsed->tokens[0];
	return *this;
}

namespace {

void print(std::ostream& os, Jsmn::Object const& o) {
	if (o.is_string()) {
		os << '"' << Detail::Str::to_escaped(std::string(o)) << '"';
	} else if (o.is_object()) {
		os << '{';
		auto first = true;
		for (auto const& key : o.keys()) {
			if (!first)
				os << ',';
			first = false;
			os << '"' << Detail::Str::to_escaped(key) << "\":";
			print(os, o[key]);
		}
		os << '}';
	} else if (o.is_array()) {
		os << '[';
		auto first = true;
		for (auto e : o) {
			if (!first)
				os << ',';
			first = false;
			print(os, e);
		}
		os << ']';
	} else {
		/* null, booleans and numbers print as written.  */
		os << o.direct_text();
	}
}

}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	print(os, o);
	return os;
}

}
