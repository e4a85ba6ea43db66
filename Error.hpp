#ifndef ERROR_HPP
#define ERROR_HPP

#include <stdexcept>
#include <string>

namespace cdbanon {

/**
 * Base class of every failure raised while anonymizing a dump.  All of them
 * are fatal for the run.
 */
class Error : public std::runtime_error {
public:

	explicit Error(const std::string& what)
		: std::runtime_error(what)
		{ }
};

/**
 * A line that can't be decoded: wrong number of fields, bad hex, bad
 * quoting or bad JSON.
 */
class ParseError : public Error {
public:

	explicit ParseError(const std::string& what)
		: Error(what)
		{ }
};

/**
 * A decoded value that doesn't have the shape its column requires
 * (e.g. a floating IP that isn't a dotted quad).
 */
class DomainError : public Error {
public:

	explicit DomainError(const std::string& what)
		: Error(what)
		{ }
};

/**
 * Reading an input stream or writing an output stream failed.
 */
class IoError : public Error {
public:

	explicit IoError(const std::string& what)
		: Error(what)
		{ }
};

} // namespace cdbanon

#endif // ERROR_HPP
