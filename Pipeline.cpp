#include "Pipeline.hpp"
#include "Error.hpp"

#include <sstream>
#include <string>

using namespace std;
using namespace cdbanon;

static string row_context(const RowAnonymizer& anonymizer, uint64_t lineno)
	{
	ostringstream rval;
	rval << TableName(anonymizer.Table()) << " table, line " << lineno << ": ";
	return rval.str();
	}

uint64_t cdbanon::ProcessTable(istream& input, ostream& output,
                               RowAnonymizer& anonymizer)
	{
	string line;
	uint64_t lineno = 0;

	while ( getline(input, line) )
		{
		++lineno;

		if ( ! line.empty() && line[line.size() - 1] == '\r' )
			line.erase(line.size() - 1);

		string encoded;

		try
			{
			Record record = Record::Decode(line);
			anonymizer.Anonymize(record);
			encoded = record.Encode();
			}
		catch ( const ParseError& e )
			{
			throw ParseError(row_context(anonymizer, lineno) + e.what());
			}
		catch ( const DomainError& e )
			{
			throw DomainError(row_context(anonymizer, lineno) + e.what());
			}

		encoded += '\n';

		if ( ! output.write(encoded.data(), encoded.size()) )
			throw IoError(row_context(anonymizer, lineno) + "write failed");
		}

	if ( input.bad() )
		throw IoError(row_context(anonymizer, lineno + 1) + "read failed");

	if ( ! output.flush() )
		throw IoError(string(TableName(anonymizer.Table())) +
		              " table: flush failed");

	return lineno;
	}
