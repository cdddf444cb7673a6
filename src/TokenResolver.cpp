#include "TokenResolver.hpp"
#include "Jwt.hpp"
#include "TokenIssuer.hpp"
#include "utils.hpp"
#include <iostream>

TokenResolver::TokenResolver(std::shared_ptr<OAuthStore> store, std::string signing_secret, Clock clock)
    : store_(std::move(store)), signing_secret_(std::move(signing_secret)), clock_(std::move(clock))
{
}

bool TokenResolver::verify_claims(const std::string &access_token, nlohmann::json &claims) const
{
    if (access_token.empty())
        return false;
    if (!jwt::VerifyToken(access_token, signing_secret_, clock_(), claims))
        return false;

    return claims.value("type", "") == "oauth_access" &&
           claims.contains("jti") && claims["jti"].is_string() &&
           claims.contains("sub") && claims["sub"].is_string() &&
           claims.contains("aud") && claims["aud"].is_string();
}

std::optional<ResolvedToken> TokenResolver::resolve(const std::string &access_token) const
{
    nlohmann::json claims;
    if (!verify_claims(access_token, claims))
        return std::nullopt;

    auto pair = store_->find_token_pair_by_access_jti(claims["jti"].get<std::string>());
    if (!pair || pair->revoked_at || clock_() >= pair->expires_at)
        return std::nullopt;

    if (pair->subject != claims["sub"].get<std::string>())
        return std::nullopt;

    ResolvedToken resolved;
    resolved.subject = pair->subject;
    resolved.client_id = claims["aud"].get<std::string>();
    resolved.scopes = pair->scopes;
    resolved.pair = std::move(*pair);
    return resolved;
}

TokenRevoker::TokenRevoker(std::shared_ptr<OAuthStore> store, std::shared_ptr<ClientRegistry> clients,
                           std::shared_ptr<TokenResolver> resolver, Clock clock)
    : store_(std::move(store)), clients_(std::move(clients)), resolver_(std::move(resolver)), clock_(std::move(clock))
{
}

bool TokenRevoker::revoke_refresh_token(const Client &client, const std::string &token, long now)
{
    auto pair = store_->find_token_pair_by_refresh_hash(TokenIssuer::hash_refresh_token(token));
    if (!pair || pair->client_pk != client.id)
        return false;
    // 已撤销的 pair 条件写返回 false，同样视为命中
    bool newly_revoked = store_->revoke_token_pair(pair->id, now);
    return newly_revoked || pair->revoked_at.has_value();
}

bool TokenRevoker::revoke_access_token(const Client &client, const std::string &token, long now)
{
    nlohmann::json claims;
    if (!resolver_->verify_claims(token, claims))
        return false;
    if (claims["aud"].get<std::string>() != client.client_id)
        return false;

    auto pair = store_->find_token_pair_by_access_jti(claims["jti"].get<std::string>());
    if (!pair || pair->client_pk != client.id)
        return false;
    // 已撤销的 pair 条件写返回 false，同样视为命中
    bool newly_revoked = store_->revoke_token_pair(pair->id, now);
    return newly_revoked || pair->revoked_at.has_value();
}

OAuthError TokenRevoker::revoke(const std::string &client_id, const std::string &client_secret,
                                const std::string &token, const std::string &token_type_hint)
{
    auto client = clients_->authenticate(client_id, client_secret);
    if (!client.ok())
        return OAuthError::InvalidClient;

    if (token.empty())
        return OAuthError::InvalidRequest;

    long now = clock_();
    bool matched = false;
    // hint 只决定查找顺序，找不到时继续尝试另一种
    if (token_type_hint == "access_token")
        matched = revoke_access_token(client.value, token, now) || revoke_refresh_token(client.value, token, now);
    else
        matched = revoke_refresh_token(client.value, token, now) || revoke_access_token(client.value, token, now);

    if (matched)
        std::cout << "令牌已撤销: client=" << client_id << std::endl;
    return OAuthError::None;
}
