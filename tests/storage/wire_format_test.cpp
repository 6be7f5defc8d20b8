#include "mpcopy/storage/wire_format.hpp"

#include <gtest/gtest.h>

using mpcopy::ErrorKind;
using mpcopy::storage::ByteRange;
using mpcopy::storage::ObjectLocation;
using mpcopy::storage::decode_copy_source;
using mpcopy::storage::encode_copy_source;
using mpcopy::storage::format_copy_source_range;
using mpcopy::storage::parse_copy_source_range;

TEST(WireFormatTest, EncodesCopySourceLikeUriComponent) {
    EXPECT_EQ(encode_copy_source({"bucket", "plain.txt"}), "bucket%2Fplain.txt");
    EXPECT_EQ(encode_copy_source({"bucket", "dir/a b+c.bin"}), "bucket%2Fdir%2Fa%20b%2Bc.bin");
    EXPECT_EQ(encode_copy_source({"bucket", "keep-_.!~*'()"}), "bucket%2Fkeep-_.!~*'()");
    EXPECT_EQ(encode_copy_source({"bucket", "caf\xC3\xA9"}), "bucket%2Fcaf%C3%A9");
}

TEST(WireFormatTest, DecodesBackToLocation) {
    const ObjectLocation source{"my-bucket", "nested/path/with space&symbols?.dat"};
    auto decoded = decode_copy_source(encode_copy_source(source));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), source);

    auto unencoded_slash = decode_copy_source("bucket/key/with/slashes");
    ASSERT_TRUE(unencoded_slash.is_ok());
    EXPECT_EQ(unencoded_slash.value().bucket, "bucket");
    EXPECT_EQ(unencoded_slash.value().key, "key/with/slashes");
}

TEST(WireFormatTest, RejectsMalformedCopySource) {
    EXPECT_TRUE(decode_copy_source("no-separator").is_error());
    EXPECT_TRUE(decode_copy_source("%2Fkey-only").is_error());
    EXPECT_TRUE(decode_copy_source("bucket%2F").is_error());
    EXPECT_TRUE(decode_copy_source("bucket%2Fbad%G1").is_error());

    auto truncated = decode_copy_source("bucket%2Fkey%4");
    ASSERT_TRUE(truncated.is_error());
    EXPECT_EQ(truncated.error().kind, ErrorKind::InvalidInput);
}

TEST(WireFormatTest, FormatsAndParsesRanges) {
    EXPECT_EQ(format_copy_source_range({0, 49'999'999}), "bytes=0-49999999");

    auto parsed = parse_copy_source_range("bytes=50000000-100000003");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().first, 50'000'000);
    EXPECT_EQ(parsed.value().last, 100'000'003);
    EXPECT_EQ(parsed.value().size(), 50'000'004);
}

TEST(WireFormatTest, RejectsMalformedRanges) {
    EXPECT_TRUE(parse_copy_source_range("0-10").is_error());
    EXPECT_TRUE(parse_copy_source_range("bytes=10").is_error());
    EXPECT_TRUE(parse_copy_source_range("bytes=-10").is_error());
    EXPECT_TRUE(parse_copy_source_range("bytes=10-").is_error());
    EXPECT_TRUE(parse_copy_source_range("bytes=10-5").is_error());
    EXPECT_TRUE(parse_copy_source_range("bytes=a-5").is_error());
}
