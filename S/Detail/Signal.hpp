#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Holds the subscribers for message type a.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	typedef std::vector<Callback> Callbacks;

	/* Replaced, never mutated, so a raise in progress keeps
	 * iterating over the subscriber list it started with.
	 */
	std::shared_ptr<Callbacks> callbacks;

	struct RaiseData {
		a value;
		std::shared_ptr<Callbacks> callbacks;
		std::exception_ptr exc;
	};

	static
	Ev::Io<void> raise_loop( std::shared_ptr<RaiseData> pdata
			       , std::size_t i
			       ) {
		if (i >= pdata->callbacks->size()) {
			if (pdata->exc)
				return Ev::Io<void>([pdata]( std::function<void()>
							   , std::function<void(std::exception_ptr)> fail
							   ) {
					fail(pdata->exc);
				});
			return Ev::lift();
		}
		auto& cb = (*pdata->callbacks)[i];
		auto step = Ev::Io<void>([pdata, cb]( std::function<void()> pass
						    , std::function<void(std::exception_ptr)>
						    ) {
			/* Every subscriber sees the message; the
			 * last failure is reported at the end.
			 */
			cb(pdata->value).run(pass, [pdata, pass](std::exception_ptr ep) {
				pdata->exc = ep;
				pass();
			});
		});
		return step.then([pdata, i]() {
			return raise_loop(pdata, i + 1);
		});
	}

public:
	Signal() : callbacks(std::make_shared<Callbacks>()) { }

	Ev::Io<void> raise(a value) {
		auto pdata = std::make_shared<RaiseData>(RaiseData{
			std::move(value), callbacks, nullptr
		});
		return Ev::yield().then([pdata]() {
			return raise_loop(pdata, 0);
		});
	}

	void subscribe(Callback cb) {
		if (!cb)
			return;
		auto ncallbacks = std::make_shared<Callbacks>(*callbacks);
		ncallbacks->push_back(std::move(cb));
		callbacks = std::move(ncallbacks);
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
