#ifndef FQNAMEPOLICY_HPP
#define FQNAMEPOLICY_HPP

#include <string>
#include <vector>

namespace cdbanon {

/**
 * Anonymize the segments of a fully-qualified name, e.g.
 * [ domain project network ].  Segments are hashed in order until one that
 * names a well-known system object (a "target" prefix, "default-project" or
 * "default-global-system-config") is reached; that segment and all those
 * after it are kept.  Segments with a "default", "ingress" or "egress"
 * prefix and segments that are UUIDs are kept as well.
 * @param segments the name, without any trailing identifier the caller
 * wants preserved.
 * @return \a segments with the sensitive ones replaced by their Hash().
 */
std::vector<std::string> HashFQName(std::vector<std::string> segments);

/**
 * @return true if \a s parses as a UUID.
 */
bool IsUUID(const std::string& s);

} // namespace cdbanon

#endif // FQNAMEPOLICY_HPP
