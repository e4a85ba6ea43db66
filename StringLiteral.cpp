#include "StringLiteral.hpp"
#include "Error.hpp"
#include "Hex.hpp"

#include <cstdint>

using namespace std;
using namespace cdbanon;

static void append_utf8(string& out, uint32_t cp)
	{
	if ( cp < 0x80 )
		out += static_cast<char>(cp);
	else if ( cp < 0x800 )
		{
		out += static_cast<char>(0xc0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3f));
		}
	else if ( cp < 0x10000 )
		{
		out += static_cast<char>(0xe0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
		out += static_cast<char>(0x80 | (cp & 0x3f));
		}
	else
		{
		out += static_cast<char>(0xf0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
		out += static_cast<char>(0x80 | (cp & 0x3f));
		}
	}

/**
 * Reads \a ndigits hex digits of \a s starting at \a pos, none of them at
 * or past \a end.
 */
static uint32_t read_hex(const string& s, string::size_type pos,
                         string::size_type end, int ndigits)
	{
	if ( pos + ndigits > end )
		throw ParseError("truncated escape sequence");

	uint32_t rval = 0;

	for ( int i = 0; i < ndigits; ++i )
		{
		int v = HexDigitValue(s[pos + i]);

		if ( v < 0 )
			throw ParseError("invalid hex digit in escape sequence");

		rval = (rval << 4) | v;
		}

	return rval;
	}

string cdbanon::Quote(const string& text)
	{
	string rval;
	rval.reserve(text.size() + 2);
	rval += '"';

	for ( string::size_type i = 0; i < text.size(); ++i )
		{
		unsigned char c = static_cast<unsigned char>(text[i]);

		switch ( c ) {
		case '"':  rval += "\\\""; break;
		case '\\': rval += "\\\\"; break;
		case '\a': rval += "\\a"; break;
		case '\b': rval += "\\b"; break;
		case '\f': rval += "\\f"; break;
		case '\n': rval += "\\n"; break;
		case '\r': rval += "\\r"; break;
		case '\t': rval += "\\t"; break;
		case '\v': rval += "\\v"; break;
		default:
			if ( c < 0x20 || c == 0x7f )
				{
				rval += "\\x";
				rval += HexDigit(c >> 4);
				rval += HexDigit(c);
				}
			else
				rval += static_cast<char>(c);
			break;
		}
		}

	rval += '"';
	return rval;
	}

string cdbanon::Unquote(const string& literal)
	{
	if ( literal.size() < 2 || literal[0] != '"' ||
	     literal[literal.size() - 1] != '"' )
		throw ParseError("value is not a quoted string");

	const string::size_type end = literal.size() - 1;
	string rval;
	rval.reserve(end);

	for ( string::size_type i = 1; i < end; )
		{
		char c = literal[i];

		if ( c == '"' )
			throw ParseError("unescaped quote inside string");

		if ( c == '\n' )
			throw ParseError("newline inside string");

		if ( c != '\\' )
			{
			rval += c;
			++i;
			continue;
			}

		if ( i + 1 >= end )
			throw ParseError("truncated escape sequence");

		char e = literal[i + 1];
		i += 2;

		switch ( e ) {
		case 'a':  rval += '\a'; break;
		case 'b':  rval += '\b'; break;
		case 'f':  rval += '\f'; break;
		case 'n':  rval += '\n'; break;
		case 'r':  rval += '\r'; break;
		case 't':  rval += '\t'; break;
		case 'v':  rval += '\v'; break;
		case '\\': rval += '\\'; break;
		case '"':  rval += '"'; break;

		case 'x':
			rval += static_cast<char>(read_hex(literal, i, end, 2));
			i += 2;
			break;

		case 'u':
		case 'U':
			{
			int ndigits = e == 'u' ? 4 : 8;
			uint32_t cp = read_hex(literal, i, end, ndigits);
			i += ndigits;

			if ( cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff) )
				throw ParseError("invalid Unicode code point in escape sequence");

			append_utf8(rval, cp);
			}
			break;

		case '0': case '1': case '2': case '3':
		case '4': case '5': case '6': case '7':
			{
			if ( i + 2 > end )
				throw ParseError("truncated octal escape sequence");

			uint32_t v = e - '0';

			for ( int k = 0; k < 2; ++k )
				{
				char d = literal[i + k];

				if ( d < '0' || d > '7' )
					throw ParseError("invalid octal escape sequence");

				v = (v << 3) | (d - '0');
				}

			if ( v > 255 )
				throw ParseError("octal escape value above 255");

			rval += static_cast<char>(v);
			i += 2;
			}
			break;

		default:
			throw ParseError(string("unknown escape sequence \\") + e);
		}
		}

	return rval;
	}
