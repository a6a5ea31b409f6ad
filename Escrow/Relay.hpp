#ifndef ESCROW_RELAY_HPP
#define ESCROW_RELAY_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Escrow {

/** class Escrow::Relay
 *
 * @brief an in-process stand-in for the medium devices
 * share: keyed JSON records per channel, broadcast to
 * every listener.
 *
 * @desc For the stored channels each delivery is a JSON
 * array of every record in the channel, as of the moment
 * of the write.
 * The pending transaction channel is not stored; each
 * delivery is the announced object itself.
 *
 * In queued mode deliveries are held until `flush`, which
 * lets tests interleave devices that have not yet heard
 * of each other's writes.
 */
class Relay {
public:
	enum Channel
	{ Contracts
	, Parties
	, PendingTransactions
	};
	typedef std::function<Ev::Io<void>( Channel
					  , std::string const&
					  )> Listener;

private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Relay();
	Relay(Relay const&) =delete;
	~Relay();

	void listen(Listener);

	/* Replaces the record under `key`.  */
	Ev::Io<void> put(Channel, std::string key, std::string json);
	Ev::Io<void> erase(Channel, std::string key);
	Ev::Io<void> announce(Channel, std::string json);

	/* The JSON array of the records now in the channel.  */
	std::string snapshot(Channel) const;

	void set_queued(bool);
	std::size_t num_queued() const;
	/* Delivers every held payload, oldest first.  */
	Ev::Io<void> flush();
};

}

#endif /* !defined(ESCROW_RELAY_HPP) */
