#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace jwt
{
    // 使用 HMAC-SHA256 签名 claims，返回紧凑格式的 JWT
    std::string GenerateToken(const nlohmann::json &claims, const std::string &secret);

    // 验证签名（定长比较）、alg 头以及 exp/nbf；now 为当前 Unix 秒。
    // 验证通过后将 payload 填充到 out_claims 并返回 true
    bool VerifyToken(const std::string &token, const std::string &secret, long now, nlohmann::json &out_claims);
}
