#include "Crypto.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>
#include <vector>

namespace
{
    const char *B64_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    const char *HEX_DIGITS = "0123456789abcdef";

    std::string to_hex(const unsigned char *data, size_t len)
    {
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; ++i)
        {
            out.push_back(HEX_DIGITS[(data[i] >> 4) & 0xF]);
            out.push_back(HEX_DIGITS[data[i] & 0xF]);
        }
        return out;
    }

    std::string base64_encode_raw(const std::string &in)
    {
        std::string out;
        unsigned int val = 0;
        int valb = -6;
        for (unsigned char c : in)
        {
            val = (val << 8) + c;
            valb += 8;
            while (valb >= 0)
            {
                out.push_back(B64_ALPHABET[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6)
            out.push_back(B64_ALPHABET[((val << 8) >> (valb + 8)) & 0x3F]);
        while (out.size() % 4)
            out.push_back('=');
        return out;
    }

    // 解码标准字母表；遇到非法字符返回 false
    bool base64_decode_raw(const std::string &in, std::string &out)
    {
        std::vector<int> T(256, -1);
        for (int i = 0; i < 64; i++)
            T[static_cast<unsigned char>(B64_ALPHABET[i])] = i;

        out.clear();
        unsigned int val = 0;
        int valb = -8;
        size_t i = 0;
        for (; i < in.size(); ++i)
        {
            unsigned char c = static_cast<unsigned char>(in[i]);
            if (c == '=')
                break;
            if (T[c] == -1)
                return false;
            val = (val << 6) + static_cast<unsigned int>(T[c]);
            valb += 6;
            if (valb >= 0)
            {
                out.push_back(char((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        // 填充之后不允许再出现数据
        for (; i < in.size(); ++i)
        {
            if (in[i] != '=')
                return false;
        }
        return true;
    }
}

namespace crypto
{
    std::string random_bytes(size_t count)
    {
        std::string out(count, '\0');
        if (count == 0)
            return out;
        if (RAND_bytes(reinterpret_cast<unsigned char *>(&out[0]), static_cast<int>(count)) != 1)
            throw std::runtime_error("RAND_bytes failed");
        return out;
    }

    std::string random_token(size_t count)
    {
        return base64_url_encode(random_bytes(count));
    }

    std::string random_hex(size_t count)
    {
        std::string raw = random_bytes(count);
        return to_hex(reinterpret_cast<const unsigned char *>(raw.data()), raw.size());
    }

    std::string sha256_hex(const std::string &input)
    {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char *>(input.data()), input.size(), hash);
        return to_hex(hash, SHA256_DIGEST_LENGTH);
    }

    std::string hmac_sha256(const std::string &key, const std::string &data)
    {
        unsigned int len = EVP_MAX_MD_SIZE;
        unsigned char digest[EVP_MAX_MD_SIZE];
        if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                 reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest, &len) == nullptr)
            throw std::runtime_error("HMAC-SHA256 failed");
        return std::string(reinterpret_cast<char *>(digest), len);
    }

    bool constant_time_equals(const std::string &a, const std::string &b)
    {
        if (a.size() != b.size())
        {
            // 长度不同也做一次等长比较，避免提前返回
            CRYPTO_memcmp(a.data(), a.data(), a.size());
            return false;
        }
        if (a.empty())
            return true;
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    std::string base64_url_encode(const std::string &in)
    {
        std::string out = base64_encode_raw(in);
        for (auto &ch : out)
        {
            if (ch == '+')
                ch = '-';
            else if (ch == '/')
                ch = '_';
        }
        while (!out.empty() && out.back() == '=')
            out.pop_back();
        return out;
    }

    std::string base64_url_decode(const std::string &in)
    {
        std::string b64 = in;
        for (auto &ch : b64)
        {
            if (ch == '-')
                ch = '+';
            else if (ch == '_')
                ch = '/';
        }
        std::string out;
        if (!base64_decode_raw(b64, out))
            return "";
        return out;
    }

    std::string base64_encode(const std::string &in)
    {
        return base64_encode_raw(in);
    }

    bool base64_decode(const std::string &in, std::string &out)
    {
        return base64_decode_raw(in, out);
    }
}
