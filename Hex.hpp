#ifndef HEX_HPP
#define HEX_HPP

#include <string>

namespace cdbanon {

/**
 * @return the value of hex digit \a c (either case), or -1 if \a c isn't one.
 */
int HexDigitValue(char c);

/**
 * @return the lowercase hex digit for \a nibble (0-15).
 */
inline char HexDigit(unsigned nibble)
	{ return "0123456789abcdef"[nibble & 0x0f]; }

/**
 * @param data arbitrary bytes.
 * @return \a data rendered as lowercase hex, two digits per byte, no prefix.
 */
std::string HexEncode(const std::string& data);

/**
 * @param hex an even number of hex digits (either case), no prefix.
 * @return the decoded bytes.
 * @throw ParseError on an odd length or a non-hex digit.
 */
std::string HexDecode(const std::string& hex);

} // namespace cdbanon

#endif // HEX_HPP
