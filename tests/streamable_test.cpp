#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <asio.hpp>

#include "streamable.hpp"

using bincodec::compose;
using bincodec::error;
using bincodec::le;
using bincodec::parse;
using bincodec::short_sequence;
using bincodec::socket_address;

namespace {

std::vector<uint8_t> concat(std::vector<uint8_t> a, const std::vector<uint8_t> &b)
{
	a.insert(a.end(), b.begin(), b.end());
	return a;
}

template<typename T>
error::kind compose_failure(const std::vector<uint8_t> &source, size_t &pos)
{
	try {
		compose<T>(source, pos);
	} catch(const error &err) {
		return err.code();
	}
	ADD_FAILURE() << "compose did not fail";
	return error::kind::recoverable_known;
}

}

static_assert(bincodec::fixed_size<uint32_t>::value == size_t(4), "uint32_t is 4 bytes");
static_assert(bincodec::fixed_size<double>::value == size_t(8), "double is 8 bytes");
static_assert(bincodec::fixed_size<le<int16_t>>::value == size_t(2), "le forwards the width");
static_assert(!bincodec::fixed_size<std::string>::value, "strings are variable");
static_assert(!bincodec::fixed_size<socket_address>::value, "addresses are variable");

template<typename T>
class PrimitiveTest : public ::testing::Test {};

using Primitives = ::testing::Types<uint8_t, uint16_t, uint32_t, uint64_t,
				    int8_t, int16_t, int32_t, int64_t, float, double>;
TYPED_TEST_SUITE(PrimitiveTest, Primitives);

TYPED_TEST(PrimitiveTest, RoundTrips) {
	std::vector<TypeParam> values {
		std::numeric_limits<TypeParam>::lowest(),
		std::numeric_limits<TypeParam>::max(),
		TypeParam(0),
		TypeParam(42),
	};
	for(TypeParam v : values) {
		std::vector<uint8_t> bytes = parse(v);
		ASSERT_EQ(bytes.size(), sizeof(TypeParam));

		size_t pos = 0;
		EXPECT_EQ(compose<TypeParam>(bytes, pos), v);
		EXPECT_EQ(pos, sizeof(TypeParam));
	}
}

TYPED_TEST(PrimitiveTest, LittleEndianIsReversedBigEndian) {
	TypeParam v = std::numeric_limits<TypeParam>::max() / 3;

	std::vector<uint8_t> big = parse(v);
	std::vector<uint8_t> little = parse(le<TypeParam>(v));
	std::reverse(big.begin(), big.end());
	EXPECT_EQ(big, little);

	size_t pos = 0;
	EXPECT_EQ(compose<le<TypeParam>>(little, pos).inner(), v);
	EXPECT_EQ(pos, sizeof(TypeParam));
}

TYPED_TEST(PrimitiveTest, TruncatedSourceFails) {
	std::vector<uint8_t> bytes = parse(TypeParam(1));
	bytes.pop_back();

	size_t pos = 0;
	EXPECT_EQ(compose_failure<TypeParam>(bytes, pos), error::kind::truncated);
	EXPECT_EQ(pos, 0u);
}

TEST(StreamableTest, LittleEndianKeepsAbsoluteCursor) {
	std::vector<uint8_t> source { 0xAA, 0xBB, 0x34, 0x12, 0xCC };

	size_t pos = 2;
	EXPECT_EQ(compose<le<uint16_t>>(source, pos).inner(), 0x1234);
	EXPECT_EQ(pos, 4u);
	EXPECT_EQ(compose<uint8_t>(source, pos), 0xCC);
}

TEST(StreamableTest, LittleEndianVariableSizeUsesRemainder) {
	std::vector<uint8_t> bytes = parse(le<std::string>(std::string("ab")));
	std::vector<uint8_t> expected { 'b', 'a', 2, 0 };
	EXPECT_EQ(bytes, expected);

	size_t pos = 0;
	EXPECT_EQ(compose<le<std::string>>(bytes, pos).inner(), "ab");
	EXPECT_EQ(pos, 4u);
}

TEST(StreamableTest, BooleanIsOneByte) {
	EXPECT_EQ(parse(true), std::vector<uint8_t> { 1 });
	EXPECT_EQ(parse(false), std::vector<uint8_t> { 0 });

	std::vector<uint8_t> source { 0, 1, 2 };
	size_t pos = 0;
	EXPECT_FALSE(compose<bool>(source, pos));
	EXPECT_TRUE(compose<bool>(source, pos));
	EXPECT_EQ(compose_failure<bool>(source, pos), error::kind::recoverable_known);
	EXPECT_EQ(pos, 2u);
}

TEST(StreamableTest, StringHasShortLengthPrefix) {
	std::vector<uint8_t> bytes = parse(std::string("hi"));
	std::vector<uint8_t> expected { 0, 2, 'h', 'i' };
	EXPECT_EQ(bytes, expected);

	std::string text = "h\xC3\xA9llo \xE2\x82\xAC";
	bytes = parse(text);
	EXPECT_EQ(bytes.size(), text.size() + 2);

	size_t pos = 0;
	EXPECT_EQ(compose<std::string>(bytes, pos), text);
	EXPECT_EQ(pos, bytes.size());
}

TEST(StreamableTest, StringRejectsInvalidUtf8) {
	std::vector<uint8_t> bad_continuation { 0, 2, 0xC3, 0x28 };
	std::vector<uint8_t> overlong { 0, 2, 0xC0, 0xAF };
	std::vector<uint8_t> surrogate { 0, 3, 0xED, 0xA0, 0x80 };

	size_t pos = 0;
	EXPECT_EQ(compose_failure<std::string>(bad_continuation, pos), error::kind::invalid_utf8);
	EXPECT_EQ(compose_failure<std::string>(overlong, pos), error::kind::invalid_utf8);
	EXPECT_EQ(compose_failure<std::string>(surrogate, pos), error::kind::invalid_utf8);
	EXPECT_EQ(pos, 0u);
}

TEST(StreamableTest, StringTruncatedPayloadFails) {
	std::vector<uint8_t> source { 0, 5, 'a', 'b' };
	size_t pos = 0;
	EXPECT_EQ(compose_failure<std::string>(source, pos), error::kind::truncated);
}

TEST(StreamableTest, StringTooLongToEncode) {
	std::string big(70000, 'x');
	try {
		parse(big);
		FAIL() << "expected an error";
	} catch(const error &err) {
		EXPECT_EQ(err.code(), error::kind::recoverable_known);
	}
}

TEST(StreamableTest, VectorUsesVarIntCount) {
	std::vector<uint16_t> values { 1, 2, 0x1234 };
	std::vector<uint8_t> bytes = parse(values);
	std::vector<uint8_t> expected { 3, 0, 1, 0, 2, 0x12, 0x34 };
	EXPECT_EQ(bytes, expected);

	size_t pos = 0;
	EXPECT_EQ(compose<std::vector<uint16_t>>(bytes, pos), values);
	EXPECT_EQ(pos, bytes.size());
}

TEST(StreamableTest, VectorLongerThanOneVarIntByte) {
	std::vector<uint8_t> values(200, 7);
	std::vector<uint8_t> bytes = parse(values);
	EXPECT_EQ(bytes.size(), 202u);

	size_t pos = 0;
	std::vector<uint8_t> decoded = compose<std::vector<uint8_t>>(bytes, pos);
	EXPECT_EQ(decoded.size(), 200u);
	EXPECT_EQ(decoded, values);
}

TEST(StreamableTest, VectorDecodesFromCursor) {
	std::vector<uint8_t> source = concat(parse(uint32_t(99)), parse(std::vector<int32_t> { -1, 5 }));

	size_t pos = 0;
	EXPECT_EQ(compose<uint32_t>(source, pos), 99u);
	std::vector<int32_t> expected { -1, 5 };
	EXPECT_EQ(compose<std::vector<int32_t>>(source, pos), expected);
	EXPECT_EQ(pos, source.size());
}

TEST(StreamableTest, VectorTruncatedFails) {
	std::vector<uint8_t> fixed { 5, 0, 1 };
	size_t pos = 0;
	EXPECT_EQ(compose_failure<std::vector<uint16_t>>(fixed, pos), error::kind::truncated);
	EXPECT_EQ(pos, 0u);

	std::vector<uint8_t> strings { 2, 0, 1, 'a' };
	EXPECT_EQ(compose_failure<std::vector<std::string>>(strings, pos), error::kind::truncated);
	EXPECT_EQ(pos, 0u);
}

TEST(StreamableTest, ShortSequenceOfLittleEndianValues) {
	short_sequence<le<uint16_t>> seq({ le<uint16_t>(1), le<uint16_t>(0x0302) });
	std::vector<uint8_t> bytes = parse(seq);
	std::vector<uint8_t> expected { 0, 2, 1, 0, 2, 3 };
	EXPECT_EQ(bytes, expected);

	size_t pos = 0;
	short_sequence<le<uint16_t>> decoded = compose<short_sequence<le<uint16_t>>>(bytes, pos);
	ASSERT_EQ(decoded.items.size(), 2u);
	EXPECT_EQ(decoded.items[1].inner(), 0x0302);
	EXPECT_EQ(pos, bytes.size());
}

TEST(StreamableTest, ShortSequenceDecodesFromCursor) {
	short_sequence<le<uint32_t>> seq({ le<uint32_t>(7) });
	std::vector<uint8_t> source = concat(parse(std::string("x")), parse(seq));

	size_t pos = 0;
	EXPECT_EQ(compose<std::string>(source, pos), "x");
	EXPECT_EQ(compose<short_sequence<le<uint32_t>>>(source, pos), seq);
	EXPECT_EQ(pos, source.size());
}

TEST(StreamableTest, ShortSequenceTruncatedFails) {
	std::vector<uint8_t> source { 0, 3, 1, 0 };
	size_t pos = 0;
	EXPECT_EQ(compose_failure<short_sequence<le<uint16_t>>>(source, pos), error::kind::truncated);
}

TEST(StreamableTest, SocketAddressV4Layout) {
	socket_address addr { asio::ip::make_address("127.0.0.1"), 19132 };
	std::vector<uint8_t> bytes = parse(addr);
	std::vector<uint8_t> expected { 4, 127, 0, 0, 1, 0x4A, 0xBC };
	EXPECT_EQ(bytes, expected);

	size_t pos = 0;
	EXPECT_EQ(compose<socket_address>(bytes, pos), addr);
	EXPECT_EQ(pos, 7u);
}

TEST(StreamableTest, SocketAddressV6Layout) {
	asio::ip::address_v6 ip = asio::ip::make_address_v6("fe80::1");
	ip.scope_id(3);
	socket_address addr { ip, 8080, 5 };

	std::vector<uint8_t> bytes = parse(addr);
	ASSERT_EQ(bytes.size(), 29u);
	EXPECT_EQ(bytes[0], 6);
	EXPECT_EQ(bytes[1], 0);
	EXPECT_EQ(bytes[2], 0);
	EXPECT_EQ(bytes[3], 0x1F);
	EXPECT_EQ(bytes[4], 0x90);
	EXPECT_EQ(bytes[8], 5);
	EXPECT_EQ(bytes[9], 0xFE);
	EXPECT_EQ(bytes[10], 0x80);
	EXPECT_EQ(bytes[24], 1);
	EXPECT_EQ(bytes[28], 3);

	size_t pos = 0;
	socket_address decoded = compose<socket_address>(bytes, pos);
	EXPECT_EQ(decoded, addr);
	EXPECT_EQ(decoded.flow_info(), 5u);
	EXPECT_EQ(decoded.address().to_v6().scope_id(), 3u);
	EXPECT_EQ(pos, 29u);
}

TEST(StreamableTest, SocketAddressUnknownTagFails) {
	std::vector<uint8_t> source { 5, 127, 0, 0, 1, 0, 80 };
	size_t pos = 0;
	EXPECT_EQ(compose_failure<socket_address>(source, pos), error::kind::unknown_tag);
	EXPECT_EQ(pos, 0u);
}

TEST(StreamableTest, SocketAddressTruncatedFails) {
	std::vector<uint8_t> v4 { 4, 127, 0 };
	size_t pos = 0;
	EXPECT_EQ(compose_failure<socket_address>(v4, pos), error::kind::truncated);
	EXPECT_EQ(pos, 0u);

	asio::ip::address_v6 ip = asio::ip::make_address_v6("2001:db8::7");
	std::vector<uint8_t> v6 = parse(socket_address { ip, 53 });
	v6.resize(20);
	EXPECT_EQ(compose_failure<socket_address>(v6, pos), error::kind::truncated);
	EXPECT_EQ(pos, 0u);
}

TEST(StreamableTest, SocketAddressFromEndpoint) {
	asio::ip::tcp::endpoint ep { asio::ip::make_address("10.1.2.3"), 443 };
	socket_address addr { ep };
	EXPECT_EQ(addr.port(), 443);

	size_t pos = 0;
	socket_address decoded = compose<socket_address>(parse(addr), pos);
	EXPECT_EQ(decoded.to_endpoint<asio::ip::tcp>(), ep);
}

TEST(StreamableTest, ConsecutiveValuesShareCursor) {
	std::vector<uint8_t> source = concat(concat(parse(uint16_t(7)), parse(std::string("hi"))), parse(true));

	size_t pos = 0;
	EXPECT_EQ(compose<uint16_t>(source, pos), 7);
	EXPECT_EQ(pos, 2u);
	EXPECT_EQ(compose<std::string>(source, pos), "hi");
	EXPECT_EQ(pos, 6u);
	EXPECT_TRUE(compose<bool>(source, pos));
	EXPECT_EQ(pos, source.size());
}

TEST(StreamableDeathTest, ForcedComposeAbortsOnError) {
	std::vector<uint8_t> source { 9 };
	size_t pos = 0;
	EXPECT_DEATH(bincodec::fcompose<bool>(source, pos), "non-binary byte");
}

TEST(StreamableTest, ForcedParseReturnsBytes) {
	EXPECT_EQ(bincodec::fparse(uint16_t(0x0102)), (std::vector<uint8_t> { 1, 2 }));
}
