#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::stringstream Content;
template<typename Up> class Array;
template<typename Up> class Object;

template<typename t>
struct Serializer;

template<typename i>
struct SignedSerializer {
	static std::string serialize(i v) {
		return std::to_string((long long) v);
	}
};
template<typename i>
struct UnsignedSerializer {
	static std::string serialize(i v) {
		return std::to_string((unsigned long long) v);
	}
};

template<>
struct Serializer<double> {
	static std::string serialize(double v) {
		return Jsmn::Detail::Str::from_double(v);
	}
};
template<> struct Serializer<int> : SignedSerializer<int> { };
template<> struct Serializer<long> : SignedSerializer<long> { };
template<> struct Serializer<long long> : SignedSerializer<long long> { };
template<> struct Serializer<unsigned int> : UnsignedSerializer<unsigned int> { };
template<> struct Serializer<unsigned long> : UnsignedSerializer<unsigned long> { };
template<> struct Serializer<unsigned long long> : UnsignedSerializer<unsigned long long> { };
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};

template<typename Up>
class Object {
private:
	Up& up;
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ",";
		else
			started = true;
	}
	void key(std::string const& name) {
		encomma();
		content << Serializer<std::string>::serialize(name) << ":";
	}

public:
	Object(Up& up_, Content& content_)
		: up(up_), content(content_), started(false) {
		content << '{';
	}

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		key(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Object<Up>> start_array(std::string const& name);
	Object<Object<Up>> start_object(std::string const& name);

	Up& end_object() {
		content << '}';
		return up;
	}
};

template<typename Up>
class Array {
private:
	Up& up;
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ",";
		else
			started = true;
	}

public:
	Array(Up& up_, Content& content_)
		: up(up_), content(content_), started(false) {
		content << '[';
	}

	template<typename a>
	Array<Up>& entry(a const& value) {
		encomma();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Array<Up>> start_array();
	Object<Array<Up>> start_object();

	Up& end_array() {
		content << ']';
		return up;
	}
};

} /* namespace Detail */

/** class Json::Out
 *
 * @brief builds JSON text.
 *
 * @desc Usage:
 *
 *     auto js = Json::Out()
 *         .start_object()
 *             .field("arkTxid", txid)
 *             .start_array("checkpointTxs")
 *                 .entry(psbt_b64)
 *             .end_array()
 *         .end_object()
 *         ;
 *
 * The output is compact, with no whitespace between
 * tokens.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	explicit
	Out(Jsmn::Object const& js
	   ) : content(std::make_shared<Json::Detail::Content>()) {
		*content << js;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		return Json::Out().start_object().end_object();
	}
};

namespace Detail {

template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};
template<>
struct Serializer<Jsmn::Object> {
	static std::string serialize(Jsmn::Object const& v) {
		std::ostringstream os;
		os << v;
		return os.str();
	}
};

template<typename Up>
Array<Object<Up>> Object<Up>::start_array(std::string const& name) {
	key(name);
	return Array<Object<Up>>(*this, content);
}
template<typename Up>
Object<Object<Up>> Object<Up>::start_object(std::string const& name) {
	key(name);
	return Object<Object<Up>>(*this, content);
}
template<typename Up>
Array<Array<Up>> Array<Up>::start_array() {
	encomma();
	return Array<Array<Up>>(*this, content);
}
template<typename Up>
Object<Array<Up>> Array<Up>::start_object() {
	encomma();
	return Object<Array<Up>>(*this, content);
}

} /* namespace Detail */

} /* namespace Json */

#endif /* !defined(JSON_OUT_HPP) */
