#pragma once

#include <memory>
#include <optional>
#include <string>
#include "ClientRegistry.hpp"
#include "OAuthStore.hpp"

struct ResolvedToken
{
    std::string subject;
    std::string client_id; // aud
    std::vector<std::string> scopes;
    TokenPair pair;
};

// Bearer access token 解析：签名与 exp 校验之外，还要求对应 TokenPair 未撤销、未过期，
// 因此轮换或撤销后旧 access token 立即失效
class TokenResolver
{
public:
    TokenResolver(std::shared_ptr<OAuthStore> store, std::string signing_secret, Clock clock);

    std::optional<ResolvedToken> resolve(const std::string &access_token) const;

    // 仅校验签名和声明，不查库
    bool verify_claims(const std::string &access_token, nlohmann::json &claims) const;

private:
    std::shared_ptr<OAuthStore> store_;
    std::string signing_secret_;
    Clock clock_;
};

// RFC 7009 撤销：认证客户端后撤销属于该客户端的匹配 TokenPair。
// 未知令牌或其他客户端的令牌静默忽略
class TokenRevoker
{
public:
    TokenRevoker(std::shared_ptr<OAuthStore> store, std::shared_ptr<ClientRegistry> clients,
                 std::shared_ptr<TokenResolver> resolver, Clock clock);

    // 返回 None、InvalidClient 或 InvalidRequest
    OAuthError revoke(const std::string &client_id, const std::string &client_secret,
                      const std::string &token, const std::string &token_type_hint);

private:
    bool revoke_refresh_token(const Client &client, const std::string &token, long now);
    bool revoke_access_token(const Client &client, const std::string &token, long now);

    std::shared_ptr<OAuthStore> store_;
    std::shared_ptr<ClientRegistry> clients_;
    std::shared_ptr<TokenResolver> resolver_;
    Clock clock_;
};
