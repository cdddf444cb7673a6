#pragma once

#include <memory>
#include <string>
#include <vector>
#include "OAuthStore.hpp"

struct TokenSettings
{
    std::string signing_secret;
    std::string issuer;
    long access_token_ttl = 3600;
    long refresh_token_ttl = 30L * 24 * 3600;
};

// access token: HS256 JWT，可离线校验（sub, aud=client_id, scope, exp, jti）
// refresh token: 随机串，服务端只存 SHA-256，可撤销
class TokenIssuer
{
public:
    TokenIssuer(std::shared_ptr<OAuthStore> store, TokenSettings settings, Clock clock);

    // 铸造并持久化一对新令牌
    IssuedTokens issue(const std::string &subject, const Client &client, const std::vector<std::string> &scopes);

    // 只生成不落库，供轮换在事务中写入；明文写入 out
    TokenPair mint(const std::string &subject, const Client &client, const std::vector<std::string> &scopes,
                   const std::string &parent_id, IssuedTokens &out) const;

    const TokenSettings &settings() const { return settings_; }

    static std::string hash_refresh_token(const std::string &refresh_token);

private:
    std::shared_ptr<OAuthStore> store_;
    TokenSettings settings_;
    Clock clock_;
};
