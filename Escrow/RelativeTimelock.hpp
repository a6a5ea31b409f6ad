#ifndef ESCROW_RELATIVETIMELOCK_HPP
#define ESCROW_RELATIVETIMELOCK_HPP

#include<cstdint>

namespace Escrow {

/** struct Escrow::RelativeTimelock
 *
 * @brief a BIP68 relative timelock, as checked by
 * `OP_CHECKSEQUENCEVERIFY`.
 */
struct RelativeTimelock {
	enum Type
	{ Blocks
	, Seconds
	};
	Type type;
	std::uint32_t value;

	RelativeTimelock() : type(Blocks), value(0) { }
	RelativeTimelock(Type type_, std::uint32_t value_)
		: type(type_), value(value_) { }

	/* Below 512 the delay counts blocks, otherwise seconds.  */
	static RelativeTimelock from_delay(std::uint32_t delay);

	/* Throws Escrow::InvalidTimelock if the value cannot be
	 * expressed.
	 */
	std::uint32_t bip68_sequence() const;
	/* Inverse of bip68_sequence.  Throws Escrow::InvalidTimelock
	 * if the disable flag is set.
	 */
	static RelativeTimelock from_sequence(std::uint32_t sequence);

	bool operator==(RelativeTimelock const& o) const {
		return type == o.type && value == o.value;
	}
	bool operator!=(RelativeTimelock const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(ESCROW_RELATIVETIMELOCK_HPP) */
