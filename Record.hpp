#ifndef RECORD_HPP
#define RECORD_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace cdbanon {

/**
 * One row of a table dump: KEY,COLUMN,VALUE.
 */
class Record {
public:

	Record()
		{ }

	Record(const std::string& arg_key, const std::string& arg_column,
	       const nlohmann::json& arg_value)
		: key(arg_key), column(arg_column), value(arg_value)
		{ }

	/**
	 * Decode a line of the dump.  KEY and COLUMN are "0x"-prefixed hex,
	 * VALUE is a quoted, escaped JSON text (quotes may be missing for bare
	 * literals).  The value field may itself contain commas.
	 * @param line a line without its terminating newline.
	 * @throw ParseError if any field can't be decoded.
	 */
	static Record Decode(const std::string& line);

	/**
	 * @return the record as a dump line, without a newline.  The value is
	 * written as a quoted, escaped JSON text, except that a value rendering
	 * as "{}" is written as the bare word null.
	 */
	std::string Encode() const;

	std::string key;    // opaque, never modified
	std::string column; // column qualifier
	nlohmann::json value;
};

} // namespace cdbanon

#endif // RECORD_HPP
