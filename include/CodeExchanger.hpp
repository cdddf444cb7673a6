#pragma once

#include <memory>
#include <string>
#include "ClientRegistry.hpp"
#include "OAuthStore.hpp"
#include "TokenIssuer.hpp"

struct CodeExchangeRequest
{
    std::string code;
    std::string redirect_uri;
    std::string client_id;
    std::string client_secret;
};

// 授权码兑换。依次校验：存在、未使用、未过期、redirect_uri 一致、客户端认证且与绑定一致；
// 首个失败即返回。标记已使用是单条条件写，并发重放只有一个调用方成功
class CodeExchanger
{
public:
    CodeExchanger(std::shared_ptr<OAuthStore> store, std::shared_ptr<ClientRegistry> clients,
                  std::shared_ptr<TokenIssuer> tokens, Clock clock);

    OAuthResult<IssuedTokens> exchange(const CodeExchangeRequest &request);

private:
    std::shared_ptr<OAuthStore> store_;
    std::shared_ptr<ClientRegistry> clients_;
    std::shared_ptr<TokenIssuer> tokens_;
    Clock clock_;
};
