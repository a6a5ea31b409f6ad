#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief typed publish/subscribe hub.
 *
 * @desc Each message type has its own subscriber list.
 * `raise` completes after every subscriber has handled
 * the message, in subscription order.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Bus();
	Bus(Bus const&) =delete;
	Bus(Bus&&);
	~Bus();

private:
	S::Detail::SignalBase* find(std::type_index) const;
	S::Detail::SignalBase& add( std::type_index
				  , std::unique_ptr<S::Detail::SignalBase>
				  );

	template<typename a>
	S::Detail::Signal<a>& signal() {
		typedef S::Detail::Signal<a> Signal;
		auto key = std::type_index(typeid(a));
		auto found = find(key);
		if (!found)
			found = &add(key, Util::make_unique<Signal>());
		return static_cast<Signal&>(*found);
	}
public:
	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
