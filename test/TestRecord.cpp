#include "Record.hpp"
#include "Error.hpp"

#include <gtest/gtest.h>

using namespace cdbanon;
using nlohmann::json;

TEST(Record, Decode)
{
	Record r = Record::Decode(
		"0x616263,0x66715f6e616d65,\"[\\\"default-domain\\\",\\\"proj1\\\"]\"");
	EXPECT_EQ(r.key, "abc");
	EXPECT_EQ(r.column, "fq_name");
	EXPECT_EQ(r.value, json({"default-domain", "proj1"}));
}

TEST(Record, DecodeBinaryKey)
{
	Record r = Record::Decode("0x00ff,0x,null");
	EXPECT_EQ(r.key, std::string("\x00\xff", 2));
	EXPECT_EQ(r.column, "");
}

TEST(Record, DecodeBareLiterals)
{
	EXPECT_TRUE(Record::Decode("0x6b,0x63,null").value.is_null());
	EXPECT_EQ(Record::Decode("0x6b,0x63,42").value, json(42));
	EXPECT_EQ(Record::Decode("0x6b,0x63,true").value, json(true));
	EXPECT_EQ(Record::Decode("0x6b,0x63,{}").value, json::object());
}

TEST(Record, DecodeValueWithCommas)
{
	Record r = Record::Decode("0x6b,0x63,\"{\\\"a\\\":1,\\\"b\\\":[1,2]}\"");
	EXPECT_EQ(r.value["a"], json(1));
	EXPECT_EQ(r.value["b"], json({1, 2}));
}

TEST(Record, DecodeStringValue)
{
	Record r = Record::Decode("0x6b,0x63,\"\\\"10.1.2.3\\\"\"");
	EXPECT_EQ(r.value, json("10.1.2.3"));
}

TEST(Record, DecodeErrors)
{
	EXPECT_THROW(Record::Decode(""), ParseError);
	EXPECT_THROW(Record::Decode("0x61,0x62"), ParseError);
	EXPECT_THROW(Record::Decode("0xzz,0x62,null"), ParseError);
	EXPECT_THROW(Record::Decode("0x6,0x62,null"), ParseError);
	EXPECT_THROW(Record::Decode("61,0x62,null"), ParseError);
	EXPECT_THROW(Record::Decode("0x61,62,null"), ParseError);
	EXPECT_THROW(Record::Decode("0x61,0x62,\"abc"), ParseError);
	EXPECT_THROW(Record::Decode("0x61,0x62,abc"), ParseError);
	EXPECT_THROW(Record::Decode("0x61,0x62,\"{\\\"a\\\":\""), ParseError);
}

TEST(Record, DecodeNumberOverflow)
{
	EXPECT_THROW(Record::Decode("0x6b,0x63,1e999"), ParseError);
	EXPECT_THROW(Record::Decode("0x6b,0x63,\"[1,-1e999]\""), ParseError);
}

TEST(Record, Encode)
{
	Record r("abc", "fq_name", json({"default-domain", "proj1"}));
	EXPECT_EQ(r.Encode(),
		  "0x616263,0x66715f6e616d65,\"[\\\"default-domain\\\",\\\"proj1\\\"]\"");
}

TEST(Record, EncodeEmptyObjectAsNull)
{
	EXPECT_EQ(Record("k", "c", json::object()).Encode(), "0x6b,0x63,null");
	EXPECT_EQ(Record("k", "c", json()).Encode(), "0x6b,0x63,\"null\"");
	EXPECT_EQ(Record("k", "c", json::array()).Encode(), "0x6b,0x63,\"[]\"");
}

TEST(Record, EncodeSortsObjectKeys)
{
	Record r("k", "c", json::parse("{\"b\":1,\"a\":\"x\"}"));
	EXPECT_EQ(r.Encode(), "0x6b,0x63,\"{\\\"a\\\":\\\"x\\\",\\\"b\\\":1}\"");
}

TEST(Record, EncodeKeepsNumberForm)
{
	EXPECT_EQ(Record::Decode("0x6b,0x63,1.0").Encode(), "0x6b,0x63,\"1.0\"");
	EXPECT_EQ(Record::Decode("0x6b,0x63,7").Encode(), "0x6b,0x63,\"7\"");
}

TEST(Record, EncodeEscapesControlCharacters)
{
	Record r("k", "c", json("tab\there"));
	// JSON escapes the tab, the literal then escapes the backslash.
	EXPECT_EQ(r.Encode(), "0x6b,0x63,\"\\\"tab\\\\there\\\"\"");
}

TEST(Record, RoundTrip)
{
	const char* lines[] = {
		"0x616263,0x66715f6e616d65,\"[\\\"default-domain\\\",\\\"proj1\\\"]\"",
		"0x6b,0x63,null",
		"0x6b,0x63,{}",
		"0x6b,0x63,12.5",
		"0x0A0b,0x70726f703a6964,\"{\\\"x\\\":[1,{\\\"y\\\":null}],\\\"z\\\":\\\"a,b\\\"}\"",
	};

	for ( const char* line : lines )
		{
		Record first = Record::Decode(line);
		Record second = Record::Decode(first.Encode());
		EXPECT_EQ(second.key, first.key) << line;
		EXPECT_EQ(second.column, first.column) << line;

		if ( first.value == json::object() )
			EXPECT_TRUE(second.value.is_null()) << line;
		else
			EXPECT_EQ(second.value, first.value) << line;
		}
}
