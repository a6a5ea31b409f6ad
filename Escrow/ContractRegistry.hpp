#ifndef ESCROW_CONTRACTREGISTRY_HPP
#define ESCROW_CONTRACTREGISTRY_HPP

#include"Escrow/Contract.hpp"
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include<memory>
#include<string>
#include<vector>

namespace Escrow { class TransportIF; }
namespace S { class Bus; }
namespace Sqlite3 { class Db; }

namespace Escrow {

/** class Escrow::ContractRegistry
 *
 * @brief this device's copy of every escrow contract,
 * keyed by address.
 *
 * @desc Local changes are stored, persisted, then
 * published whole to the transport.
 * Records arriving from the transport replace the local
 * record of the same address wholesale; the last one
 * delivered wins.
 *
 * If given an invalid (default-constructed) database the
 * registry lives in memory only.
 */
class ContractRegistry {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Ev::Semaphore& lock(std::string const& address);

public:
	ContractRegistry() =delete;
	ContractRegistry(ContractRegistry const&) =delete;

	ContractRegistry( S::Bus& bus
			, TransportIF& transport
			, Sqlite3::Db db
			);
	~ContractRegistry();

	/* Creates the table, loads what was persisted, then
	 * subscribes to the transport and merges in what it
	 * already has.
	 */
	Ev::Io<void> start();

	Ev::Io<void> upsert(Contract contract);

	std::vector<Contract> contracts() const;
	/* Those where the key is buyer, seller or arbitrator.  */
	std::vector<Contract>
	contracts_for(Secp256k1::XonlyPubKey const& key) const;
	bool has(std::string const& address) const;
	/* Throws Escrow::UnknownContract.  */
	Contract find(std::string const& address) const;

	/** Escrow::ContractRegistry::exclusive
	 *
	 * @brief runs the action with no other exclusive
	 * action on the same address running.
	 *
	 * @desc Actions that read a contract, change it and
	 * upsert it must run under this, and must look the
	 * contract up only once they are running.
	 */
	template<typename a>
	Ev::Io<a> exclusive(std::string const& address, Ev::Io<a> action) {
		return lock(address).run(std::move(action));
	}
};

}

#endif /* !defined(ESCROW_CONTRACTREGISTRY_HPP) */
