#ifndef STRINGLITERAL_HPP
#define STRINGLITERAL_HPP

#include <string>

namespace cdbanon {

/**
 * Render text as a double-quoted, backslash-escaped string literal.
 * Quotes, backslashes and control bytes are escaped; everything else,
 * including UTF-8 sequences, is copied as is.
 */
std::string Quote(const std::string& text);

/**
 * Interpret a double-quoted string literal, the inverse of Quote().
 * Accepts the escapes \\a \\b \\f \\n \\r \\t \\v \\\\ \\", \\xHH, three-digit
 * octal, \\uHHHH and \\UHHHHHHHH.
 * @param literal text starting and ending with a double quote.
 * @return the unescaped contents.
 * @throw ParseError if \a literal isn't a well-formed quoted string.
 */
std::string Unquote(const std::string& literal);

} // namespace cdbanon

#endif // STRINGLITERAL_HPP
