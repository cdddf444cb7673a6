#include "TokenIssuer.hpp"
#include "Crypto.hpp"
#include "Jwt.hpp"
#include "config.hpp"
#include "utils.hpp"

TokenIssuer::TokenIssuer(std::shared_ptr<OAuthStore> store, TokenSettings settings, Clock clock)
    : store_(std::move(store)), settings_(std::move(settings)), clock_(std::move(clock))
{
}

std::string TokenIssuer::hash_refresh_token(const std::string &refresh_token)
{
    return crypto::sha256_hex(refresh_token);
}

TokenPair TokenIssuer::mint(const std::string &subject, const Client &client, const std::vector<std::string> &scopes,
                            const std::string &parent_id, IssuedTokens &out) const
{
    long now = clock_();

    TokenPair pair;
    pair.id = crypto::random_hex();
    pair.access_jti = crypto::random_hex();
    pair.subject = subject;
    pair.client_pk = client.id;
    pair.scopes = scopes;
    pair.issued_at = now;
    pair.expires_at = now + settings_.access_token_ttl;
    pair.refresh_expires_at = now + settings_.refresh_token_ttl;
    pair.parent_id = parent_id;

    nlohmann::json claims = {
        {"iss", settings_.issuer},
        {"sub", subject},
        {"aud", client.client_id},
        {"scope", utils::join(scopes, " ")},
        {"iat", now},
        {"exp", pair.expires_at},
        {"jti", pair.access_jti},
        {"type", "oauth_access"}};

    out.access_token = jwt::GenerateToken(claims, settings_.signing_secret);
    out.refresh_token = crypto::random_token(48);
    out.token_type = config::TOKEN_TYPE_BEARER;
    out.expires_in = settings_.access_token_ttl;
    out.scopes = scopes;

    pair.refresh_token_hash = hash_refresh_token(out.refresh_token);
    return pair;
}

IssuedTokens TokenIssuer::issue(const std::string &subject, const Client &client, const std::vector<std::string> &scopes)
{
    IssuedTokens tokens;
    TokenPair pair = mint(subject, client, scopes, "", tokens);
    if (!store_->insert_token_pair(pair))
        throw StoreError("无法持久化令牌记录");
    return tokens;
}
