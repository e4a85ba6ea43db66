#include "Hex.hpp"
#include "Error.hpp"

using namespace std;
using namespace cdbanon;

int cdbanon::HexDigitValue(char c)
	{
	if ( c >= '0' && c <= '9' )
		return c - '0';

	if ( c >= 'a' && c <= 'f' )
		return c - 'a' + 10;

	if ( c >= 'A' && c <= 'F' )
		return c - 'A' + 10;

	return -1;
	}

string cdbanon::HexEncode(const string& data)
	{
	string rval;
	rval.reserve(data.size() * 2);

	for ( string::size_type i = 0; i < data.size(); ++i )
		{
		unsigned char c = static_cast<unsigned char>(data[i]);
		rval += HexDigit(c >> 4);
		rval += HexDigit(c);
		}

	return rval;
	}

string cdbanon::HexDecode(const string& hex)
	{
	if ( hex.size() % 2 != 0 )
		throw ParseError("odd number of hex digits");

	string rval;
	rval.reserve(hex.size() / 2);

	for ( string::size_type i = 0; i < hex.size(); i += 2 )
		{
		int hi = HexDigitValue(hex[i]);
		int lo = HexDigitValue(hex[i + 1]);

		if ( hi < 0 || lo < 0 )
			throw ParseError("invalid hex digit");

		rval += static_cast<char>((hi << 4) | lo);
		}

	return rval;
	}
