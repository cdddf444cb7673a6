#include "CodeExchanger.hpp"
#include "AuthorizationCodeIssuer.hpp"
#include <iostream>

CodeExchanger::CodeExchanger(std::shared_ptr<OAuthStore> store, std::shared_ptr<ClientRegistry> clients,
                             std::shared_ptr<TokenIssuer> tokens, Clock clock)
    : store_(std::move(store)), clients_(std::move(clients)), tokens_(std::move(tokens)), clock_(std::move(clock))
{
}

OAuthResult<IssuedTokens> CodeExchanger::exchange(const CodeExchangeRequest &request)
{
    using Result = OAuthResult<IssuedTokens>;

    if (request.code.empty() || request.redirect_uri.empty() || request.client_id.empty())
        return Result::failure(OAuthError::InvalidRequest);

    const std::string code_hash = AuthorizationCodeIssuer::hash_code(request.code);
    auto code = store_->find_code(code_hash);
    if (!code)
        return Result::failure(OAuthError::InvalidGrant);

    long now = clock_();
    if (AuthorizationCodeIssuer::state_of(*code, now) != CodeState::Pending)
        return Result::failure(OAuthError::InvalidGrant);

    if (code->redirect_uri != request.redirect_uri)
        return Result::failure(OAuthError::InvalidGrant);

    auto client = clients_->authenticate(request.client_id, request.client_secret);
    if (!client.ok())
        return Result::failure(OAuthError::InvalidClient);

    if (client.value.id != code->client_pk)
        return Result::failure(OAuthError::InvalidGrant);

    // 竞争失败与重放同样处理，不重试
    if (!store_->consume_code(code_hash, now))
    {
        std::cerr << "授权码重复兑换被拒绝: client=" << request.client_id << std::endl;
        return Result::failure(OAuthError::InvalidGrant);
    }

    IssuedTokens tokens = tokens_->issue(code->subject, client.value, code->scopes);
    std::cout << "授权码兑换成功: subject=" << code->subject << " client=" << request.client_id << std::endl;
    return Result::success(std::move(tokens));
}
