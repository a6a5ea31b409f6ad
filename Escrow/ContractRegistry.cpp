#include"Escrow/ContractCodec.hpp"
#include"Escrow/ContractRegistry.hpp"
#include"Escrow/Error.hpp"
#include"Escrow/TransportIF.hpp"
#include"Escrow/log.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include<map>

namespace Escrow {

class ContractRegistry::Impl {
public:
	S::Bus& bus;
	TransportIF& transport;
	Sqlite3::Db db;

	std::map<std::string, Contract> records;
	std::map<std::string, std::unique_ptr<Ev::Semaphore>> locks;

	Impl( S::Bus& bus_
	    , TransportIF& transport_
	    , Sqlite3::Db db_
	    ) : bus(bus_), transport(transport_), db(std::move(db_)) { }

	void put(Contract const& c) {
		auto it = records.find(c.address);
		if (it != records.end())
			it->second = c;
		else
			records.insert(std::make_pair(c.address, c));
	}

	Ev::Io<void> init() {
		if (!db)
			return Ev::lift();
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS "EscrowContracts"
			     ( address TEXT PRIMARY KEY
			     , record TEXT NOT NULL
			     );
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<void> load() {
		if (!db)
			return Ev::lift();
		return db.transact().then([this](Sqlite3::Tx tx) {
			auto fetch = tx.query(R"QRY(
			SELECT record FROM "EscrowContracts";
			)QRY")
				.execute()
				;
			auto count = std::size_t(0);
			for (auto& r : fetch) {
				auto c = ContractCodec::contract_from_json(
					r.get<std::string>(0)
				);
				put(c);
				++count;
			}
			tx.commit();
			return log( bus, Debug
				  , "ContractRegistry: loaded %zu contracts."
				  , count
				  );
		});
	}

	Ev::Io<void> persist(Contract const& c) {
		if (!db)
			return Ev::lift();
		auto address = c.address;
		auto record = ContractCodec::to_json(c);
		return db.transact().then([address, record](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			INSERT OR REPLACE INTO "EscrowContracts"
			VALUES(:address, :record);
			)QRY")
				.bind(":address", address)
				.bind(":record", record)
				.execute()
				;
			tx.commit();
			return Ev::lift();
		});
	}

	/* Replaces each record that differs from ours.  */
	Ev::Io<void> merge(std::shared_ptr<std::vector<Contract>> incoming
			  , std::size_t i
			  ) {
		if (i >= incoming->size())
			return Ev::lift();
		auto& c = (*incoming)[i];
		auto it = records.find(c.address);
		if (it != records.end() && it->second == c)
			return merge(incoming, i + 1);

		put(c);
		auto address = c.address;
		return persist(c).then([this, address]() {
			return log( bus, Debug
				  , "ContractRegistry: %s replaced from transport."
				  , address.c_str()
				  );
		}).then([this, incoming, i]() {
			return merge(incoming, i + 1);
		});
	}
};

ContractRegistry::ContractRegistry( S::Bus& bus
				  , TransportIF& transport
				  , Sqlite3::Db db
				  ) : pimpl(Util::make_unique<Impl>( bus
								   , transport
								   , std::move(db)
								   )) { }
ContractRegistry::~ContractRegistry() { }

Ev::Io<void> ContractRegistry::start() {
	return pimpl->init().then([this]() {
		return pimpl->load();
	}).then([this]() {
		pimpl->transport.subscribe_contracts([this
						     ](std::vector<Contract> const& cs) {
			auto incoming = std::make_shared<std::vector<Contract>>(cs);
			return pimpl->merge(std::move(incoming), 0);
		});
		return pimpl->transport.get_contracts();
	}).then([this](std::vector<Contract> cs) {
		auto incoming = std::make_shared<std::vector<Contract>>(
			std::move(cs)
		);
		return pimpl->merge(std::move(incoming), 0);
	});
}

Ev::Io<void> ContractRegistry::upsert(Contract contract) {
	auto pc = std::make_shared<Contract>(std::move(contract));
	return Ev::lift().then([this, pc]() {
		pimpl->put(*pc);
		return pimpl->persist(*pc);
	}).then([this, pc]() {
		return pimpl->transport.publish_contract(*pc);
	});
}

std::vector<Contract> ContractRegistry::contracts() const {
	auto rv = std::vector<Contract>();
	for (auto const& r : pimpl->records)
		rv.push_back(r.second);
	return rv;
}
std::vector<Contract>
ContractRegistry::contracts_for(Secp256k1::XonlyPubKey const& key) const {
	auto rv = std::vector<Contract>();
	for (auto const& r : pimpl->records)
		if (r.second.involves(key))
			rv.push_back(r.second);
	return rv;
}
bool ContractRegistry::has(std::string const& address) const {
	return pimpl->records.find(address) != pimpl->records.end();
}
Contract ContractRegistry::find(std::string const& address) const {
	auto it = pimpl->records.find(address);
	if (it == pimpl->records.end())
		throw UnknownContract(address);
	return it->second;
}

Ev::Semaphore& ContractRegistry::lock(std::string const& address) {
	auto& l = pimpl->locks[address];
	if (!l)
		l = Util::make_unique<Ev::Semaphore>(1);
	return *l;
}

}
