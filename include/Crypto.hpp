#pragma once

#include <string>

namespace crypto
{
    // 密码学安全随机字节（RAND_bytes），失败时抛出 std::runtime_error
    std::string random_bytes(size_t count);

    // 随机 URL 安全字符串，count 为熵字节数
    std::string random_token(size_t count = 32);

    // 随机十六进制串，用作记录主键
    std::string random_hex(size_t count = 16);

    std::string sha256_hex(const std::string &input);

    std::string hmac_sha256(const std::string &key, const std::string &data);

    // 定长比较，耗时不依赖于首个不同字节的位置
    bool constant_time_equals(const std::string &a, const std::string &b);

    std::string base64_url_encode(const std::string &in);
    std::string base64_url_decode(const std::string &in);

    // 标准 base64（HTTP Basic 认证），解码非法输入时返回 false
    std::string base64_encode(const std::string &in);
    bool base64_decode(const std::string &in, std::string &out);
}
