#include "IPv4Randomizer.hpp"
#include "Error.hpp"

#include <cstdlib>
#include <arpa/inet.h>
#include <netinet/in.h>

using namespace std;
using namespace cdbanon;

static const int RANDOM_MAX = 2147483647;

// Largest value a mask element may take, so XOR keeps an octet in [0, 255].
static const long MAX_MASK_VALUE = 254;

/**
 * @return an int in range [0, upper], inclusive.
 */
static long random_int(long upper)
	{
	long r;
	++upper;
	long last_valid_random_val = RANDOM_MAX - (RANDOM_MAX % upper) - 1;
	// Remove modulo bias.
	do { r = random(); } while ( r > last_valid_random_val );
	return r % upper;
	}

IPv4Randomizer IPv4Randomizer::FromSeed(unsigned seed)
	{
	char state[256];
	char* prev_state = initstate(seed, state, sizeof(state));
	Mask mask;

	for ( int i = 0; i < NUM_MASKED_OCTETS; ++i )
		mask[i] = static_cast<uint8_t>(random_int(MAX_MASK_VALUE));

	setstate(prev_state);
	return IPv4Randomizer(mask);
	}

string IPv4Randomizer::Randomize(const string& addr) const
	{
	in_addr addr_n;

	if ( inet_pton(AF_INET, addr.c_str(), &addr_n) != 1 )
		throw DomainError("malformed IPv4 address '" + addr + "'");

	// Network order: the first octet is byte 0 and is kept.
	uint8_t* octets = reinterpret_cast<uint8_t*>(&addr_n.s_addr);

	for ( int i = 1; i <= NUM_MASKED_OCTETS; ++i )
		octets[i] ^= mask[i - 1];

	char addrstr[INET_ADDRSTRLEN];
	inet_ntop(AF_INET, &addr_n, addrstr, sizeof(addrstr));
	return addrstr;
	}
