#ifndef ROWANONYMIZER_HPP
#define ROWANONYMIZER_HPP

#include <cstdint>

#include "IPv4Randomizer.hpp"
#include "Record.hpp"

namespace cdbanon {

/**
 * The two tables of a dump.
 */
enum TableType {
	TABLE_FQNAME, // rows keyed by object type, column is "name:...:uuid"
	TABLE_UUID,   // rows keyed by object UUID, column is a property name
};

/**
 * @return "fqname" or "uuid".
 */
const char* TableName(TableType table);

class RowAnonymizer {
public:

	/**
	 * @param table which table the rows come from.
	 * @param ip_randomizer run-wide randomizer for floating IP addresses.
	 */
	RowAnonymizer(TableType table, const IPv4Randomizer& ip_randomizer);

	TableType Table() const
		{ return table; }

	/**
	 * Anonymize a row in place.  The key is never touched.
	 * @throw DomainError if a value doesn't have the shape its column
	 * requires.
	 */
	void Anonymize(Record& record)
		{ (this->*anonymizer)(record); }

	/**
	 * Counts of values replaced so far, by kind.
	 */
	uint64_t NumColumnNames() const
		{ return num_column_names; }

	uint64_t NumFQNames() const
		{ return num_fq_names; }

	uint64_t NumDisplayNames() const
		{ return num_display_names; }

	uint64_t NumFloatingIPs() const
		{ return num_floating_ips; }

private:

	typedef void (RowAnonymizer::*anonymize_func)(Record& record);

	/**
	 * The column is "seg:seg:...:id"; hash the segments, keep the id.
	 */
	void AnonymizeFQNameRow(Record& record);

	/**
	 * Dispatch on the column name.
	 */
	void AnonymizeUUIDRow(Record& record);

	void AnonymizeFQNameValue(Record& record);
	void AnonymizeDisplayName(Record& record);
	void AnonymizeFloatingIP(Record& record);

	TableType table;
	anonymize_func anonymizer;
	IPv4Randomizer ip_randomizer;
	uint64_t num_column_names;
	uint64_t num_fq_names;
	uint64_t num_display_names;
	uint64_t num_floating_ips;
};

} // namespace cdbanon

#endif // ROWANONYMIZER_HPP
