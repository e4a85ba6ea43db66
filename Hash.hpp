#ifndef HASH_HPP
#define HASH_HPP

#include <string>

namespace cdbanon {

/**
 * One-way digest used to replace sensitive names.  There is no salt: the
 * same input hashes identically within and across runs, which keeps
 * references between the FQName and UUID tables consistent.
 * @param data arbitrary bytes.
 * @return the SHA-256 of \a data as 64 lowercase hex digits.
 */
std::string Hash(const std::string& data);

} // namespace cdbanon

#endif // HASH_HPP
