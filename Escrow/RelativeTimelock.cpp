#include"Escrow/Error.hpp"
#include"Escrow/RelativeTimelock.hpp"

namespace {

auto const disable_flag = std::uint32_t(1) << 31;
auto const type_flag = std::uint32_t(1) << 22;
auto const granularity = std::uint32_t(9);

}

namespace Escrow {

RelativeTimelock RelativeTimelock::from_delay(std::uint32_t delay) {
	if (delay < 512)
		return RelativeTimelock(Blocks, delay);
	return RelativeTimelock(Seconds, delay);
}

std::uint32_t RelativeTimelock::bip68_sequence() const {
	if (type == Blocks) {
		if (value >= 65536)
			throw InvalidTimelock( std::to_string(value)
					     + " blocks exceeds 65535"
					     );
		return value;
	}
	if (value % 512 != 0)
		throw InvalidTimelock( std::to_string(value)
				     + " seconds is not a multiple of 512"
				     );
	if ((value >> granularity) >= 65536)
		throw InvalidTimelock( std::to_string(value)
				     + " seconds is too long"
				     );
	return (value >> granularity) | type_flag;
}

RelativeTimelock RelativeTimelock::from_sequence(std::uint32_t sequence) {
	if (sequence & disable_flag)
		throw InvalidTimelock("sequence has relative locktime disabled");
	if (sequence & type_flag)
		return RelativeTimelock(Seconds, (sequence & 0xFFFF) << granularity);
	return RelativeTimelock(Blocks, sequence & 0xFFFF);
}

}
