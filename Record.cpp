#include "Record.hpp"
#include "Error.hpp"
#include "Hex.hpp"
#include "StringLiteral.hpp"

using namespace std;
using namespace cdbanon;

static string decode_hex_field(const string& field, const char* name)
	{
	if ( field.size() < 2 || field[0] != '0' ||
	     (field[1] != 'x' && field[1] != 'X') )
		throw ParseError(string("missing 0x prefix in ") + name);

	try
		{
		return HexDecode(field.substr(2));
		}
	catch ( const ParseError& e )
		{
		throw ParseError(string(e.what()) + " in " + name);
		}
	}

Record Record::Decode(const string& line)
	{
	string::size_type first = line.find(',');
	string::size_type second = first == string::npos ?
	        string::npos : line.find(',', first + 1);

	if ( second == string::npos )
		throw ParseError("expected 3 comma-separated fields");

	Record rval;
	rval.key = decode_hex_field(line.substr(0, first), "key");
	rval.column = decode_hex_field(line.substr(first + 1, second - first - 1),
	                               "column");

	string literal = line.substr(second + 1);

	// Some dumps leave bare JSON literals unquoted.
	if ( literal.empty() || literal[0] != '"' )
		literal = '"' + literal + '"';

	string text;

	try
		{
		text = Unquote(literal);
		}
	catch ( const ParseError& e )
		{
		throw ParseError(string(e.what()) + " in value");
		}

	try
		{
		rval.value = nlohmann::json::parse(text);
		}
	catch ( const nlohmann::json::exception& e )
		{
		throw ParseError(string("invalid JSON value: ") + e.what());
		}

	return rval;
	}

string Record::Encode() const
	{
	string rendered;

	try
		{
		rendered = value.dump();
		}
	catch ( const nlohmann::json::type_error& e )
		{
		throw DomainError(string("can't render value: ") + e.what());
		}

	string rval = "0x" + HexEncode(key) + ",0x" + HexEncode(column) + ",";

	// The loader expects an empty object to be written as null.
	if ( rendered == "{}" )
		rval += "null";
	else
		rval += Quote(rendered);

	return rval;
	}
