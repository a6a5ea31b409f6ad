#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#if !VESCROW_EXCEPTION_BACKTRACE

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Forwards construction to the wrapped exception type when
 * backtraces are not compiled in.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... As>
	BacktraceException(As&&... as)
		: E(std::forward<As>(as)...) { }

	char const* what() const noexcept override {
		return E::what();
	}
};

}

#else /* VESCROW_EXCEPTION_BACKTRACE */

#include<cstdlib>
#include<execinfo.h>
#include<sstream>
#include<string>
#include<utility>
#include<vector>

#define UNW_LOCAL_ONLY
#include<libunwind.h>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Wraps an exception type E, walking the call stack
 * with libunwind at construction.
 *
 * @desc Only the instruction pointers are kept; turning them
 * into symbols waits until `what()` is first called, so
 * exceptions caught as part of normal flow stay cheap.
 */
template<typename E>
class BacktraceException : public E {
private:
	static constexpr std::size_t max_frames = 64;

	std::vector<unw_word_t> ips;
	mutable bool formatted;
	mutable std::string message;

	void unwind() {
		unw_context_t context;
		unw_cursor_t cursor;
		if (unw_getcontext(&context) != 0)
			return;
		if (unw_init_local(&cursor, &context) != 0)
			return;
		while (ips.size() < max_frames && unw_step(&cursor) > 0) {
			auto ip = unw_word_t();
			if (unw_get_reg(&cursor, UNW_REG_IP, &ip) != 0)
				break;
			ips.push_back(ip);
		}
	}

	std::string format() const {
		auto os = std::ostringstream();
		os << E::what() << "\nBacktrace:\n";
		if (ips.empty())
			return os.str();

		auto frames = std::vector<void*>();
		for (auto ip : ips)
			frames.push_back(reinterpret_cast<void*>(ip));
		auto syms = ::backtrace_symbols(&frames[0], int(frames.size()));
		for (auto i = std::size_t(0); i < frames.size(); ++i) {
			os << "#" << i << " ";
			if (syms)
				os << syms[i];
			else
				os << frames[i];
			os << "\n";
		}
		std::free(syms);
		return os.str();
	}

public:
	template<typename... As>
	BacktraceException(As&&... as)
		: E(std::forward<As>(as)...)
		, formatted(false)
		{
		unwind();
	}

	char const* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			message = format();
		}
		return message.c_str();
	}
};

}

#endif /* VESCROW_EXCEPTION_BACKTRACE */

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
