#include "Hash.hpp"
#include "Hex.hpp"
#include "Error.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

using namespace std;
using namespace cdbanon;

string cdbanon::Hash(const string& data)
	{
	unsigned char md[EVP_MAX_MD_SIZE];
	unsigned int md_len = 0;

	if ( ! EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), 0) )
		{
		char buf[120];
		ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
		throw Error(string("Failed to compute digest: ") + buf);
		}

	return HexEncode(string(reinterpret_cast<const char*>(md), md_len));
	}
