#include "RowAnonymizer.hpp"
#include "Error.hpp"
#include "FQNamePolicy.hpp"
#include "Hash.hpp"

#include <string>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

using namespace std;
using namespace cdbanon;

const char* cdbanon::TableName(TableType table)
	{
	switch ( table ) {
	case TABLE_FQNAME:
		return "fqname";
	case TABLE_UUID:
		return "uuid";
	}

	return "unknown";
	}

RowAnonymizer::RowAnonymizer(TableType arg_table,
                             const IPv4Randomizer& arg_ip_randomizer)
	: table(arg_table), anonymizer(0), ip_randomizer(arg_ip_randomizer),
	  num_column_names(0), num_fq_names(0), num_display_names(0),
	  num_floating_ips(0)
	{
	switch ( table ) {
	case TABLE_FQNAME:
		anonymizer = &RowAnonymizer::AnonymizeFQNameRow;
		break;

	case TABLE_UUID:
		anonymizer = &RowAnonymizer::AnonymizeUUIDRow;
		break;
	}
	}

void RowAnonymizer::AnonymizeFQNameRow(Record& record)
	{
	vector<string> fqname;
	boost::algorithm::split(fqname, record.column,
	                        boost::algorithm::is_any_of(":"));
	string id = fqname.back();
	fqname.pop_back();

	fqname = HashFQName(fqname);
	fqname.push_back(id);
	record.column = boost::algorithm::join(fqname, ":");
	++num_column_names;
	}

void RowAnonymizer::AnonymizeUUIDRow(Record& record)
	{
	if ( record.column == "fq_name" )
		AnonymizeFQNameValue(record);
	else if ( record.column == "prop:display_name" )
		AnonymizeDisplayName(record);
	else if ( record.column == "prop:floating_ip_address" )
		AnonymizeFloatingIP(record);
	}

void RowAnonymizer::AnonymizeFQNameValue(Record& record)
	{
	if ( ! record.value.is_array() )
		throw DomainError("fq_name value is not an array");

	vector<string> fqname;
	fqname.reserve(record.value.size());

	for ( nlohmann::json::const_iterator it = record.value.begin();
	      it != record.value.end(); ++it )
		{
		if ( ! it->is_string() )
			throw DomainError("fq_name value has a non-string element");

		fqname.push_back(it->get<string>());
		}

	// Unlike the FQName table, this holds the whole name: no trailing id.
	record.value = HashFQName(fqname);
	++num_fq_names;
	}

void RowAnonymizer::AnonymizeDisplayName(Record& record)
	{
	switch ( record.value.type() ) {
	case nlohmann::json::value_t::string:
		record.value = Hash(record.value.get<string>());
		break;

	default:
		// Not a plain name; hash its JSON text.
		record.value = Hash(record.value.dump());
		break;
	}

	++num_display_names;
	}

void RowAnonymizer::AnonymizeFloatingIP(Record& record)
	{
	if ( ! record.value.is_string() )
		throw DomainError("prop:floating_ip_address value is not a string");

	record.value = ip_randomizer.Randomize(record.value.get<string>());
	++num_floating_ips;
	}
