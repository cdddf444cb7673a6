#include <gtest/gtest.h>
#include <set>
#include "Crypto.hpp"
#include "utils.hpp"

TEST(CryptoTest, Sha256KnownVector)
{
    EXPECT_EQ(crypto::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(crypto::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoTest, HmacSha256Rfc4231Case2)
{
    std::string mac = crypto::hmac_sha256("Jefe", "what do ya want for nothing?");
    ASSERT_EQ(mac.size(), 32u);

    static const char *hex = "0123456789abcdef";
    std::string encoded;
    for (unsigned char c : mac)
    {
        encoded.push_back(hex[c >> 4]);
        encoded.push_back(hex[c & 0xF]);
    }
    EXPECT_EQ(encoded, "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoTest, RandomTokenIsUrlSafeAndUnpadded)
{
    std::string token = crypto::random_token(32);
    EXPECT_EQ(token.size(), 43u);
    EXPECT_EQ(token.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"),
              std::string::npos);
}

TEST(CryptoTest, RandomValuesDoNotRepeat)
{
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i)
        EXPECT_TRUE(seen.insert(crypto::random_token()).second);

    std::string id = crypto::random_hex();
    EXPECT_EQ(id.size(), 32u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(CryptoTest, ConstantTimeEquals)
{
    EXPECT_TRUE(crypto::constant_time_equals("secret", "secret"));
    EXPECT_FALSE(crypto::constant_time_equals("secret", "secreT"));
    EXPECT_FALSE(crypto::constant_time_equals("secret", "secret-longer"));
    EXPECT_TRUE(crypto::constant_time_equals("", ""));
}

TEST(CryptoTest, Base64UrlRoundTripOfBinary)
{
    std::string binary("\xfb\xff\x00\x01\xfe", 5);
    std::string encoded = crypto::base64_url_encode(binary);
    EXPECT_EQ(encoded.find_first_of("+/="), std::string::npos);
    EXPECT_EQ(crypto::base64_url_decode(encoded), binary);
    EXPECT_EQ(crypto::base64_url_decode("not*base64"), "");
}

TEST(CryptoTest, StandardBase64DecodeForBasicAuth)
{
    std::string out;
    ASSERT_TRUE(crypto::base64_decode("Zm9vOmJhcg==", out));
    EXPECT_EQ(out, "foo:bar");
    EXPECT_FALSE(crypto::base64_decode("Zm9v!mJhcg==", out));
    EXPECT_FALSE(crypto::base64_decode("Zm9v=mJh", out));
}

TEST(UtilsTest, FormParsingDecodesAndKeepsFirstDuplicate)
{
    auto params = utils::parse_form("a=1&b=hello+world&c=%2Fpath%3Fx&a=2&&=skip");
    EXPECT_EQ(params.at("a"), "1");
    EXPECT_EQ(params.at("b"), "hello world");
    EXPECT_EQ(params.at("c"), "/path?x");
    EXPECT_EQ(params.count(""), 0u);
}

TEST(UtilsTest, AppendQueryEncodesValues)
{
    EXPECT_EQ(utils::append_query("https://x.test/cb", {{"code", "a b"}, {"state", "s&t"}}),
              "https://x.test/cb?code=a%20b&state=s%26t");
    EXPECT_EQ(utils::append_query("https://x.test/cb?v=1", {{"error", "access_denied"}}),
              "https://x.test/cb?v=1&error=access_denied");
}

TEST(UtilsTest, ToLowerLeavesNonAsciiBytesUntouched)
{
    EXPECT_EQ(utils::to_lower("Content-TYPE"), "content-type");
    // UTF-8 "É" 的两个字节都 >= 0x80
    EXPECT_EQ(utils::to_lower("X-\xC3\x89T\xFF"), "x-\xC3\x89t\xFF");
}
