#include"Escrow/Relay.hpp"
#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<deque>
#include<map>
#include<vector>

namespace {

typedef Escrow::Relay::Listener Listener;
typedef Escrow::Relay::Channel Channel;

struct Delivery {
	Channel channel;
	std::string payload;
};

Ev::Io<void>
deliver( std::shared_ptr<std::vector<Listener>> listeners
       , std::size_t i
       , std::shared_ptr<Delivery> d
       ) {
	if (i >= listeners->size())
		return Ev::lift();
	return (*listeners)[i](d->channel, d->payload)
		.then([listeners, i, d]() {
		return deliver(listeners, i + 1, d);
	});
}

}

namespace Escrow {

class Relay::Impl {
public:
	std::map<Channel, std::map<std::string, std::string>> records;
	std::vector<Listener> listeners;
	bool queued;
	std::deque<Delivery> queue;

	Impl() : queued(false) { }

	std::string snapshot(Channel c) const {
		auto rv = std::string("[");
		auto it = records.find(c);
		if (it != records.end()) {
			auto first = true;
			for (auto const& r : it->second) {
				if (!first)
					rv += ",";
				first = false;
				rv += r.second;
			}
		}
		rv += "]";
		return rv;
	}

	Ev::Io<void> send(Channel c, std::string payload) {
		if (queued) {
			queue.push_back(Delivery{c, std::move(payload)});
			return Ev::lift();
		}
		/* Listeners added during delivery wait for the
		 * next one.
		 */
		auto ls = std::make_shared<std::vector<Listener>>(listeners);
		auto d = std::make_shared<Delivery>(Delivery{c, std::move(payload)});
		return deliver(std::move(ls), 0, std::move(d));
	}

	Ev::Io<void> flush() {
		if (queue.empty())
			return Ev::lift();
		auto d = std::make_shared<Delivery>(std::move(queue.front()));
		queue.pop_front();
		auto ls = std::make_shared<std::vector<Listener>>(listeners);
		return deliver(std::move(ls), 0, std::move(d))
			.then([this]() {
			return flush();
		});
	}
};

Relay::Relay() : pimpl(Util::make_unique<Impl>()) { }
Relay::~Relay() { }

void Relay::listen(Listener l) {
	pimpl->listeners.push_back(std::move(l));
}

Ev::Io<void> Relay::put(Channel c, std::string key, std::string json) {
	pimpl->records[c][key] = std::move(json);
	return pimpl->send(c, pimpl->snapshot(c));
}
Ev::Io<void> Relay::erase(Channel c, std::string key) {
	pimpl->records[c].erase(key);
	return pimpl->send(c, pimpl->snapshot(c));
}
Ev::Io<void> Relay::announce(Channel c, std::string json) {
	return pimpl->send(c, std::move(json));
}

std::string Relay::snapshot(Channel c) const {
	return pimpl->snapshot(c);
}

void Relay::set_queued(bool q) {
	pimpl->queued = q;
}
std::size_t Relay::num_queued() const {
	return pimpl->queue.size();
}
Ev::Io<void> Relay::flush() {
	return pimpl->flush();
}

}
