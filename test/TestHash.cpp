#include "Hash.hpp"
#include "Hex.hpp"
#include "Error.hpp"

#include <gtest/gtest.h>

using namespace cdbanon;

TEST(Hash, KnownDigests)
{
	EXPECT_EQ(Hash(""),
		  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
	EXPECT_EQ(Hash("abc"),
		  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hash, DeterministicLowercaseHex)
{
	const std::string h = Hash("my-project");
	EXPECT_EQ(h, Hash("my-project"));
	EXPECT_NE(h, Hash("my-project2"));
	ASSERT_EQ(h.size(), 64u);
	EXPECT_EQ(h.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(Hash, BinaryInput)
{
	const std::string data("a\0b", 3);
	EXPECT_NE(Hash(data), Hash("a"));
	EXPECT_EQ(Hash(data).size(), 64u);
}

TEST(Hex, Encode)
{
	EXPECT_EQ(HexEncode(""), "");
	EXPECT_EQ(HexEncode(std::string("\x00\x7f\xff", 3)), "007fff");
	EXPECT_EQ(HexEncode("fq_name"), "66715f6e616d65");
}

TEST(Hex, Decode)
{
	EXPECT_EQ(HexDecode(""), "");
	EXPECT_EQ(HexDecode("66715F6e616D65"), "fq_name");
	EXPECT_EQ(HexDecode("00ff"), std::string("\x00\xff", 2));
}

TEST(Hex, DecodeErrors)
{
	EXPECT_THROW(HexDecode("abc"), ParseError);
	EXPECT_THROW(HexDecode("zz"), ParseError);
	EXPECT_THROW(HexDecode("0x12"), ParseError);
}
