#pragma once

#include <memory>
#include <string>
#include "ClientRegistry.hpp"
#include "OAuthStore.hpp"
#include "TokenIssuer.hpp"

struct RefreshRequest
{
    std::string refresh_token;
    std::string client_id;
    std::string client_secret;
};

// refresh_token 轮换：旧 pair 撤销与新 pair 写入在同一事务内完成。
// 已轮换的 refresh token 再次出现视为泄露，其后继令牌一并撤销
class TokenRefresher
{
public:
    TokenRefresher(std::shared_ptr<OAuthStore> store, std::shared_ptr<ClientRegistry> clients,
                   std::shared_ptr<TokenIssuer> tokens, Clock clock);

    OAuthResult<IssuedTokens> refresh(const RefreshRequest &request);

private:
    // 沿 parent_id 撤销全部后继，返回撤销数量
    size_t revoke_descendants(const std::string &pair_id, long now);

    std::shared_ptr<OAuthStore> store_;
    std::shared_ptr<ClientRegistry> clients_;
    std::shared_ptr<TokenIssuer> tokens_;
    Clock clock_;
};
