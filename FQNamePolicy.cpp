#include "FQNamePolicy.hpp"
#include "Hash.hpp"

#include <stdexcept>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>

using namespace std;
using namespace cdbanon;

static bool starts_with(const string& s, const char* prefix)
	{
	return s.compare(0, char_traits<char>::length(prefix), prefix) == 0;
	}

static bool is_system_object(const string& segment)
	{
	return starts_with(segment, "target") ||
	       segment == "default-project" ||
	       segment == "default-global-system-config";
	}

static bool is_reserved(const string& segment)
	{
	return starts_with(segment, "default") ||
	       starts_with(segment, "ingress") ||
	       starts_with(segment, "egress");
	}

bool cdbanon::IsUUID(const string& s)
	{
	try
		{
		boost::uuids::string_generator gen;
		gen(s);
		return true;
		}
	catch ( const runtime_error& )
		{
		// string_generator reports a malformed string this way.
		return false;
		}
	}

vector<string> cdbanon::HashFQName(vector<string> segments)
	{
	for ( vector<string>::iterator it = segments.begin();
	      it != segments.end(); ++it )
		{
		if ( is_system_object(*it) )
			break;

		if ( is_reserved(*it) || IsUUID(*it) )
			continue;

		*it = Hash(*it);
		}

	return segments;
	}
