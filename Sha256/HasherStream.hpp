#ifndef SHA256_HASHERSTREAM_HPP
#define SHA256_HASHERSTREAM_HPP

#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include<ostream>
#include<streambuf>
#include<string>

namespace Sha256 {

namespace Detail {

/* Unbuffered; every write goes straight to the hasher.  */
class HasherStreamBuf : public std::streambuf {
private:
	Sha256::Hasher hasher;

protected:
	std::streamsize xsputn(char const* s, std::streamsize n) override;
	int_type overflow(int_type ch) override;

public:
	HasherStreamBuf() =default;
	explicit HasherStreamBuf(std::string const& tag) : hasher(tag) { }

	Hash finalize()&&;
};

}

/** class Sha256::HasherStream
 *
 * @brief an `std::ostream` whose output is fed to
 * a SHA-256 hasher.
 *
 * @desc Constructed with a tag, the result is the BIP340
 * tagged hash of whatever is written.
 * Neither copyable nor movable.
 */
class HasherStream : private Detail::HasherStreamBuf
		   , public std::ostream {
public:
	HasherStream() : std::ostream(static_cast<std::streambuf*>(this)) { }
	explicit
	HasherStream(std::string const& tag)
		: Detail::HasherStreamBuf(tag)
		, std::ostream(static_cast<std::streambuf*>(this))
		{ }
	HasherStream(HasherStream const&) =delete;
	HasherStream(HasherStream&&) =delete;

	Hash finalize()&& {
		flush();
		return std::move(static_cast<Detail::HasherStreamBuf&>(*this))
			.finalize();
	}
};

}

#endif /* !defined(SHA256_HASHERSTREAM_HPP) */
