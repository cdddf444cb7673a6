#include "TokenRefresher.hpp"
#include <iostream>
#include <vector>

TokenRefresher::TokenRefresher(std::shared_ptr<OAuthStore> store, std::shared_ptr<ClientRegistry> clients,
                               std::shared_ptr<TokenIssuer> tokens, Clock clock)
    : store_(std::move(store)), clients_(std::move(clients)), tokens_(std::move(tokens)), clock_(std::move(clock))
{
}

size_t TokenRefresher::revoke_descendants(const std::string &pair_id, long now)
{
    size_t revoked = 0;
    std::vector<std::string> pending = {pair_id};
    while (!pending.empty())
    {
        std::string current = pending.back();
        pending.pop_back();
        for (const auto &child : store_->find_token_pairs_by_parent(current))
        {
            if (store_->revoke_token_pair(child.id, now))
                ++revoked;
            pending.push_back(child.id);
        }
    }
    return revoked;
}

OAuthResult<IssuedTokens> TokenRefresher::refresh(const RefreshRequest &request)
{
    using Result = OAuthResult<IssuedTokens>;

    if (request.refresh_token.empty() || request.client_id.empty())
        return Result::failure(OAuthError::InvalidRequest);

    auto client = clients_->authenticate(request.client_id, request.client_secret);
    if (!client.ok())
        return Result::failure(OAuthError::InvalidClient);

    auto pair = store_->find_token_pair_by_refresh_hash(TokenIssuer::hash_refresh_token(request.refresh_token));
    if (!pair || pair->client_pk != client.value.id)
        return Result::failure(OAuthError::InvalidGrant);

    long now = clock_();
    if (pair->revoked_at)
    {
        size_t revoked = revoke_descendants(pair->id, now);
        if (revoked > 0)
        {
            std::cerr << "检测到已轮换的 refresh token 被重复使用，撤销后继令牌 " << revoked
                      << " 个: subject=" << pair->subject << " client=" << request.client_id << std::endl;
        }
        return Result::failure(OAuthError::InvalidGrant);
    }

    if (now >= pair->refresh_expires_at)
        return Result::failure(OAuthError::InvalidGrant);

    IssuedTokens tokens;
    TokenPair replacement = tokens_->mint(pair->subject, client.value, pair->scopes, pair->id, tokens);
    if (!store_->rotate_token_pair(pair->id, now, replacement))
        return Result::failure(OAuthError::InvalidGrant);

    std::cout << "令牌已轮换: subject=" << pair->subject << " client=" << request.client_id << std::endl;
    return Result::success(std::move(tokens));
}
