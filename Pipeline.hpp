#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <cstdint>
#include <istream>
#include <ostream>

#include "RowAnonymizer.hpp"

namespace cdbanon {

/**
 * Stream a table dump through decode, anonymize and encode, one line at a
 * time.  Output rows are in input order, one per input line.
 * @param input the table dump.
 * @param output where the anonymized dump is written; flushed on return.
 * @param anonymizer the transform for the table being processed.
 * @return number of rows written.
 * @throw ParseError or DomainError for the first bad row, prefixed with the
 * table name and line number; nothing is written for that row.
 * @throw IoError if reading \a input or writing \a output fails.
 */
uint64_t ProcessTable(std::istream& input, std::ostream& output,
                      RowAnonymizer& anonymizer);

} // namespace cdbanon

#endif // PIPELINE_HPP
