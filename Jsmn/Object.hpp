#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<iterator>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct Parsed; }}

namespace Jsmn {

/* Thrown when converting or using as incorrect type.  */
class TypeError : public Util::BacktraceException<std::invalid_argument> {
public:
	TypeError()
		: Util::BacktraceException<std::invalid_argument>(
			"Jsmn::TypeError: incorrect type"
		  ) { }
};

/** class Jsmn::Object
 *
 * @brief a read-only view of one value inside parsed
 * JSON text.
 *
 * @desc Copies share the parsed text.
 * A default-constructed Object is a JSON null.
 */
class Object {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	Object(std::shared_ptr<Detail::Parsed>, std::size_t);

public:
	Object();

	/* Parses text that must hold exactly one JSON datum.
	 * Throws Jsmn::ParseError otherwise.
	 */
	static Object parse_json(std::string const&);

	Object(Object const&) =default;
	Object(Object&&) =default;
	Object& operator=(Object const&) =default;
	Object& operator=(Object&&) =default;

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* Conversions throw TypeError if not of the correct type.  */
	explicit operator bool() const; /* Return false if null as well.  */
	explicit operator std::string() const;
	explicit operator double() const;

	/* Number of keys for objects, number of elements for arrays.
	 * Will throw TypeError if not object or array.
	 */
	std::size_t size() const;
	std::size_t length() const { return size(); }

	/* Act as an object.  */
	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	Object operator[](std::string const&) const; /* Return null if key not exist.  */
	/* Act as an array.  */
	Object operator[](std::size_t) const; /* Return null if out-of-range.  */

	/* Raw token text, such as the digits of a number.  */
	std::string direct_text() const;

	/* Forward iteration over the elements of an array.  */
	class const_iterator {
	private:
		std::shared_ptr<Detail::Parsed> parsed;
		std::size_t i;

		const_iterator( std::shared_ptr<Detail::Parsed> parsed_
			      , std::size_t i_
			      ) : parsed(std::move(parsed_)), i(i_) { }
		friend class Object;
		friend class Object::Impl;

	public:
		typedef std::forward_iterator_tag iterator_category;
		typedef Object value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Object const* pointer;
		typedef Object reference;

		const_iterator() : parsed(nullptr), i(0) { }

		Object operator*() const;
		const_iterator& operator++();
		const_iterator operator++(int) {
			auto ret = *this;
			++(*this);
			return ret;
		}

		bool operator==(const_iterator const& o) const {
			return parsed == o.parsed && i == o.i;
		}
		bool operator!=(const_iterator const& o) const {
			return !(*this == o);
		}
	};
	typedef const_iterator iterator;

	/* Throw TypeError if not an array.  */
	const_iterator begin() const;
	const_iterator end() const;
};

/* Compact, single-line output.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
