#include"Escrow/Directory.hpp"
#include"Escrow/TransportIF.hpp"
#include"Escrow/log.hpp"
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<map>

namespace {

char const* const friendly_names[] =
{ "Alice", "Bob", "Carol", "Dave", "Eve", "Frank", "Grace", "Heidi"
, "Ivan", "Judy", "Mallory", "Oscar", "Peggy", "Quentin", "Rupert"
, "Sybil", "Trent", "Ursula", "Victor", "Walter", "Xavier", "Yvonne"
, "Zeke"
};

}

namespace Escrow {

class Directory::Impl {
public:
	S::Bus& bus;
	TransportIF& transport;
	std::map<Secp256k1::XonlyPubKey, Party> parties;

	Impl(S::Bus& bus_, TransportIF& transport_)
		: bus(bus_), transport(transport_) { }

	void replace(std::vector<Party> const& ps) {
		parties.clear();
		for (auto const& p : ps)
			parties.insert(std::make_pair(p.pubkey, p));
	}

	std::set<std::string> used_names() const {
		auto rv = std::set<std::string>();
		for (auto const& p : parties)
			rv.insert(p.second.name);
		return rv;
	}
};

Directory::Directory(S::Bus& bus, TransportIF& transport)
	: pimpl(Util::make_unique<Impl>(bus, transport)) { }
Directory::~Directory() { }

Ev::Io<void> Directory::start() {
	return Ev::lift().then([this]() {
		pimpl->transport.subscribe_parties([this
						   ](std::vector<Party> const& ps) {
			pimpl->replace(ps);
			return Ev::lift();
		});
		return pimpl->transport.get_parties();
	}).then([this](std::vector<Party> ps) {
		pimpl->replace(ps);
		return log( pimpl->bus, Debug
			  , "Directory: %zu participants known."
			  , ps.size()
			  );
	});
}

Ev::Io<Party> Directory::enroll( Secp256k1::XonlyPubKey pubkey
			       , std::string address
			       ) {
	auto it = pimpl->parties.find(pubkey);
	if (it != pimpl->parties.end())
		return Ev::lift(it->second);

	auto p = Party{ next_name(pimpl->used_names())
		      , std::move(pubkey)
		      , std::move(address)
		      , Ev::now_ms()
		      };
	pimpl->parties.insert(std::make_pair(p.pubkey, p));
	return pimpl->transport.publish_party(p).then([this, p]() {
		return log( pimpl->bus, Info
			  , "Directory: registered %s as %s."
			  , std::string(p.pubkey).c_str()
			  , p.name.c_str()
			  );
	}).then([p]() {
		return Ev::lift(p);
	});
}

Ev::Io<void> Directory::unenroll(Secp256k1::XonlyPubKey pubkey) {
	auto it = pimpl->parties.find(pubkey);
	if (it == pimpl->parties.end())
		return Ev::lift();
	auto name = it->second.name;
	pimpl->parties.erase(it);
	return pimpl->transport.unpublish_party(pubkey).then([this, name]() {
		return log( pimpl->bus, Info
			  , "Directory: unregistered %s."
			  , name.c_str()
			  );
	});
}

std::vector<Party> Directory::participants() const {
	auto rv = std::vector<Party>();
	for (auto const& p : pimpl->parties)
		rv.push_back(p.second);
	std::stable_sort( rv.begin(), rv.end()
			, [](Party const& a, Party const& b) {
		return a.created_at > b.created_at;
	});
	return rv;
}

std::shared_ptr<Party const>
Directory::lookup(Secp256k1::XonlyPubKey const& pubkey) const {
	auto it = pimpl->parties.find(pubkey);
	if (it == pimpl->parties.end())
		return nullptr;
	return std::make_shared<Party>(it->second);
}

std::string Directory::next_name(std::set<std::string> const& used) {
	for (auto n : friendly_names)
		if (used.count(n) == 0)
			return n;
	for (auto i = 1;; ++i) {
		auto n = std::string(friendly_names[0]) + " " + std::to_string(i);
		if (used.count(n) == 0)
			return n;
	}
}

}
