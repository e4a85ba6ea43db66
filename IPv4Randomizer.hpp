#ifndef IPV4RANDOMIZER_HPP
#define IPV4RANDOMIZER_HPP

#include <array>
#include <cstdint>
#include <string>

namespace cdbanon {

class IPv4Randomizer {
public:

	static const int NUM_MASKED_OCTETS = 3;

	typedef std::array<uint8_t, NUM_MASKED_OCTETS> Mask;

	/**
	 * Initialize the randomizer with a fixed mask.
	 * @param arg_mask values XOR'd into the 2nd, 3rd and 4th octet of every
	 * address.
	 */
	explicit IPv4Randomizer(const Mask& arg_mask)
		: mask(arg_mask)
		{ }

	/**
	 * Initialize the randomizer with a mask drawn from a RNG seeded with
	 * \a seed.  The mask is fixed for the randomizer object's lifetime, so
	 * the same address always randomizes to the same result.
	 * @param seed a seed for the RNG.
	 */
	static IPv4Randomizer FromSeed(unsigned seed);

	/**
	 * Randomize the last three octets of an IPv4 address.  Applying this
	 * twice gives back the original address.
	 * @param addr a dotted-quad IPv4 address, e.g. "10.1.2.3".
	 * @return \a addr with octets 2-4 XOR'd with the mask.
	 * @throw DomainError if inet_pton() doesn't accept \a addr.
	 */
	std::string Randomize(const std::string& addr) const;

	const Mask& GetMask() const
		{ return mask; }

private:

	Mask mask;
};

} // namespace cdbanon

#endif // IPV4RANDOMIZER_HPP
