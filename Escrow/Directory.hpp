#ifndef ESCROW_DIRECTORY_HPP
#define ESCROW_DIRECTORY_HPP

#include"Escrow/Contract.hpp"
#include<memory>
#include<set>
#include<string>
#include<vector>

namespace Escrow { class TransportIF; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Escrow {

/** class Escrow::Directory
 *
 * @brief the participants known to this device, with the
 * friendly names they were given.
 *
 * @desc Participant sets arriving from the transport
 * replace the directory.
 */
class Directory {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Directory() =delete;
	Directory(Directory const&) =delete;

	Directory(S::Bus& bus, TransportIF& transport);
	~Directory();

	Ev::Io<void> start();

	/** Escrow::Directory::enroll
	 *
	 * @brief registers the key under the next free
	 * friendly name and publishes it.
	 *
	 * @desc A key already registered keeps its record and
	 * nothing is published.
	 */
	Ev::Io<Party> enroll( Secp256k1::XonlyPubKey pubkey
			    , std::string address
			    );
	/* Does nothing if the key is not registered.  */
	Ev::Io<void> unenroll(Secp256k1::XonlyPubKey pubkey);

	/* Most recently registered first.  */
	std::vector<Party> participants() const;
	/* Null if the key is not registered.  */
	std::shared_ptr<Party const>
	lookup(Secp256k1::XonlyPubKey const& pubkey) const;

	/* "Alice" to "Zeke", then "Alice 1", "Alice 2" and so on.  */
	static std::string next_name(std::set<std::string> const& used);
};

}

#endif /* !defined(ESCROW_DIRECTORY_HPP) */
