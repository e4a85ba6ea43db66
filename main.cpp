#include <getopt.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cinttypes>
#include <exception>
#include <fstream>
#include <string>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "Error.hpp"
#include "IPv4Randomizer.hpp"
#include "Pipeline.hpp"
#include "RowAnonymizer.hpp"

using namespace std;
using namespace cdbanon;

static void usage(const string& program)
	{
	fprintf(stderr, "%s [options] <fqname-dump> <uuid-dump> <dst-dir>\n",
	        program.c_str());
	fprintf(stderr, "    -h|--help        | display usage info\n");
	fprintf(stderr, "    -k|--key-file    | key file to read (or create)\n");
	}

static option long_options[] = {
	{"key-file",           required_argument,       0, 'k'},
	{"help",               no_argument,             0, 'h'},
	{0,                    0,                       0,   0},
};

static const char* opt_string = "k:h";

static const int KEY_LEN = sizeof(unsigned);

static string errno_string()
	{
	char buf[128];
	// GNU strerror_r may return a static string instead of filling buf.
	return strerror_r(errno, buf, sizeof(buf));
	}

static int safe_open(const char* filename, int flags)
	{
	int fd;

	if ( flags & O_CREAT )
		fd = open(filename, flags, 0600);
	else
		fd = open(filename, flags);

	if ( fd == -1 )
		throw IoError(string("Failed to open ") + filename + ": " +
		              errno_string());

	return fd;
	}

static void read_key(uint8_t key[KEY_LEN], const char* filename)
	{
	int fd = safe_open(filename, O_RDONLY);
	int numread = 0;

	while ( numread < KEY_LEN )
		{
		ssize_t n = read(fd, key + numread, KEY_LEN - numread);

		if ( n < 0 )
			{
			string err = errno_string();
			close(fd);
			throw IoError(string("Failed reading ") + filename + ": " + err);
			}

		numread += n;

		if ( n == 0 && numread < KEY_LEN )
			{
			close(fd);
			throw IoError(string("Failure: not enough data in ") + filename +
			              " for " + to_string(KEY_LEN) + " byte key");
			}
		}

	close(fd);
	}

static void write_key(const uint8_t key[KEY_LEN], const char* filename)
	{
	int fd = safe_open(filename, O_WRONLY|O_CREAT);
	int numwritten = 0;

	while ( numwritten < KEY_LEN )
		{
		ssize_t n = write(fd, key + numwritten, KEY_LEN - numwritten);

		if ( n < 0 )
			{
			string err = errno_string();
			close(fd);
			throw IoError(string("Failed writing ") + filename + ": " + err);
			}

		numwritten += n;
		}

	close(fd);
	}

static bool file_exists(const char* filename)
	{
	return access(filename, F_OK) != -1;
	}

static void random_key(uint8_t key[KEY_LEN])
	{
	if ( RAND_bytes(key, KEY_LEN) == 1 )
		return;

	char buf[120];
	ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
	throw Error(string("Failed to generate key: ") + buf);
	}

static unsigned init_seed(const string& key_file)
	{
	uint8_t key[KEY_LEN];

	if ( key_file.empty() )
		random_key(key);
	else
		{
		if ( file_exists(key_file.c_str()) )
			read_key(key, key_file.c_str());
		else
			{
			random_key(key);
			write_key(key, key_file.c_str());
			}
		}

	unsigned seed;
	memcpy(&seed, key, sizeof(seed));
	return seed;
	}

static string base_name(const string& path)
	{
	string::size_type slash = path.find_last_of('/');
	return slash == string::npos ? path : path.substr(slash + 1);
	}

static void open_input(ifstream& f, const string& filename)
	{
	f.open(filename.c_str(), ios::in | ios::binary);

	if ( ! f )
		throw IoError("Failed to open " + filename + ": " + errno_string());
	}

static void open_output(ofstream& f, const string& filename)
	{
	f.open(filename.c_str(), ios::out | ios::trunc | ios::binary);

	if ( ! f )
		throw IoError("Failed to open " + filename + ": " + errno_string());
	}

static int run(const string& fqname_dump, const string& uuid_dump,
               const string& dst, const string& key_file)
	{
	IPv4Randomizer ip_randomizer =
	        IPv4Randomizer::FromSeed(init_seed(key_file));

	ifstream uuid_in, fqname_in;
	ofstream uuid_out, fqname_out;
	open_input(uuid_in, uuid_dump);
	open_input(fqname_in, fqname_dump);
	open_output(uuid_out, dst + "/" + base_name(uuid_dump));
	open_output(fqname_out, dst + "/" + base_name(fqname_dump));

	RowAnonymizer uuid_anon(TABLE_UUID, ip_randomizer);
	uint64_t uuid_rows = ProcessTable(uuid_in, uuid_out, uuid_anon);

	RowAnonymizer fqname_anon(TABLE_FQNAME, ip_randomizer);
	uint64_t fqname_rows = ProcessTable(fqname_in, fqname_out, fqname_anon);

	printf("UUID table (%s)\n", uuid_dump.c_str());
	printf("  Rows processed:            %" PRIu64 "\n", uuid_rows);
	printf("  FQ names anonymized:       %" PRIu64 "\n",
	       uuid_anon.NumFQNames());
	printf("  Display names anonymized:  %" PRIu64 "\n",
	       uuid_anon.NumDisplayNames());
	printf("  Floating IPs randomized:   %" PRIu64 "\n",
	       uuid_anon.NumFloatingIPs());
	printf("FQName table (%s)\n", fqname_dump.c_str());
	printf("  Rows processed:            %" PRIu64 "\n", fqname_rows);
	printf("  Column names anonymized:   %" PRIu64 "\n",
	       fqname_anon.NumColumnNames());
	return 0;
	}

int main(int argc, char** argv)
	{
	string key_file;

	for ( ; ; )
		{
		int o = getopt_long(argc, argv, opt_string, long_options, 0);

		if ( o == -1 )
			break;

		switch ( o ) {
		case 'k':
			key_file = optarg;
			break;
		case 'h':
			usage(argv[0]);
			return 0;
		default:
			usage(argv[0]);
			return 1;
		}
		}

	if ( argc - optind != 3 )
		{
		usage(argv[0]);
		return 1;
		}

	try
		{
		return run(argv[optind], argv[optind + 1], argv[optind + 2],
		           key_file);
		}
	catch ( const cdbanon::Error& e )
		{
		fprintf(stderr, "%s\n", e.what());
		}
	catch ( const exception& e )
		{
		fprintf(stderr, "Unexpected failure: %s\n", e.what());
		}

	return 1;
	}
