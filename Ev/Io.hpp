#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	typedef a type;
};

/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	typedef std::function<void(a)> type;
};
template<>
struct PassFunc<void> {
	typedef std::function<void()> type;
};

typedef std::function<void(std::exception_ptr)> FailFunc;

/* Wraps a pass function so it fires at most once, and only
 * if the shared completion flag is still clear.
 */
template<typename a>
struct Once {
	static typename PassFunc<a>::type
	wrap(std::shared_ptr<bool> done, typename PassFunc<a>::type pass) {
		return [done, pass](a value) {
			if (*done)
				return;
			*done = true;
			pass(std::move(value));
		};
	}
};
template<>
struct Once<void> {
	static PassFunc<void>::type
	wrap(std::shared_ptr<bool> done, PassFunc<void>::type pass) {
		return [done, pass]() {
			if (*done)
				return;
			*done = true;
			pass();
		};
	}
};

template<typename a>
class IoBase {
public:
	typedef
	std::function<void ( typename PassFunc<a>::type
			   , FailFunc
			   )> CoreFunc;

protected:
	CoreFunc core;

	template<typename b>
	friend class Ev::Io;
	template<typename b>
	friend class IoBase;

public:
	explicit
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief if the action fails with an exception of type
	 * `e`, run the given handler instead.
	 * Other exceptions propagate unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename PassFunc<a>::type pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr ep) {
				auto next = std::unique_ptr<Io<a>>();
				try {
					std::rethrow_exception(ep);
				} catch (e const& err) {
					try {
						next.reset(new Io<a>(handler(err)));
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(pass, sub_fail);
		});
	}

	/** Ev::Io<a>::run
	 *
	 * @brief executes the action.
	 * At most one of `pass` or `fail` is called, exactly once.
	 */
	void run( typename PassFunc<a>::type pass
		, FailFunc fail
		) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto sub_pass = Once<a>::wrap(done, std::move(pass));
		auto sub_fail = [done, fail](std::exception_ptr ep) {
			if (*done)
				return;
			*done = true;
			fail(std::move(ep));
		};
		try {
			core(std::move(sub_pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	explicit
	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>
	then(f func) const {
		typedef
		typename Detail::IoInner<typename std::result_of<f(a)>::type>::type
		b;
		auto core_copy = this->core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func(std::move(value))));
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(sub_pass, fail);
		});
	}
};

template<>
class Io<void> : public Detail::IoBase<void> {
public:
	explicit
	Io(Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f()>::type>::type>
	then(f func) const {
		typedef
		typename Detail::IoInner<typename std::result_of<f()>::type>::type
		b;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func()));
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(sub_pass, fail);
		});
	}
};

/* The value is moved out, so run the result only once.  */
template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

/** Ev::fail<a>
 *
 * @brief an action that fails with the given exception.
 */
template<typename a, typename e>
Io<a> fail(e err) {
	auto ep = std::make_exception_ptr(std::move(err));
	return Io<a>([ep]( typename Detail::PassFunc<a>::type
			 , Detail::FailFunc fail
			 ) {
		fail(ep);
	});
}

}

#endif /* !defined(EV_IO_HPP) */
