#include "AuthorizationCodeIssuer.hpp"
#include "Crypto.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

AuthorizationCodeIssuer::AuthorizationCodeIssuer(std::shared_ptr<OAuthStore> store,
                                                 std::shared_ptr<ClientRegistry> clients,
                                                 std::shared_ptr<AccessEvaluator> access,
                                                 Clock clock, long code_ttl)
    : store_(std::move(store)), clients_(std::move(clients)), access_(std::move(access)),
      clock_(std::move(clock)), code_ttl_(code_ttl)
{
}

std::string AuthorizationCodeIssuer::hash_code(const std::string &code)
{
    return crypto::sha256_hex(code);
}

std::vector<std::string> AuthorizationCodeIssuer::negotiate_scopes(const std::string &scope)
{
    std::vector<std::string> scopes;
    for (const auto &item : utils::split(scope, ' '))
    {
        bool supported = std::find(config::SUPPORTED_SCOPES.begin(), config::SUPPORTED_SCOPES.end(), item) !=
                         config::SUPPORTED_SCOPES.end();
        if (supported && std::find(scopes.begin(), scopes.end(), item) == scopes.end())
            scopes.push_back(item);
    }
    if (scopes.empty())
        scopes.push_back(config::DEFAULT_SCOPE);
    return scopes;
}

std::string AuthorizationCodeIssuer::redirect_with(const std::string &redirect_uri,
                                                   std::vector<std::pair<std::string, std::string>> params,
                                                   const std::string &state)
{
    if (!state.empty())
        params.emplace_back("state", state);
    return utils::append_query(redirect_uri, params);
}

OAuthResult<Client> AuthorizationCodeIssuer::validate_client(const AuthorizationRequest &request) const
{
    if (request.client_id.empty() || request.redirect_uri.empty())
        return OAuthResult<Client>::failure(OAuthError::InvalidRequest);

    auto client = clients_->find_active(request.client_id);
    if (!client)
        return OAuthResult<Client>::failure(OAuthError::InvalidClient);

    if (!clients_->is_redirect_uri_allowed(*client, request.redirect_uri))
        return OAuthResult<Client>::failure(OAuthError::InvalidRequest);

    return OAuthResult<Client>::success(*client);
}

AuthorizationDecision AuthorizationCodeIssuer::authorize(const UserRecord &principal, const AuthorizationRequest &request)
{
    AuthorizationDecision decision;

    auto validated = validate_client(request);
    if (!validated.ok())
    {
        decision.error = validated.error;
        return decision;
    }
    const Client &client = validated.value;

    // 从这里开始 redirect_uri 已验证，错误可以回跳
    decision.can_redirect = true;

    if (request.response_type != config::RESPONSE_TYPE_CODE)
    {
        decision.error = OAuthError::UnsupportedResponseType;
        decision.location = redirect_with(request.redirect_uri, {{"error", to_string(decision.error)}}, request.state);
        return decision;
    }

    if (!principal.active || !access_->can_access(principal.id, client))
    {
        std::cout << "授权被拒绝: subject=" << principal.id << " client=" << client.client_id << std::endl;
        decision.error = OAuthError::AccessDenied;
        decision.location = redirect_with(request.redirect_uri, {{"error", to_string(decision.error)}}, request.state);
        return decision;
    }

    decision.code = issue(principal.id, client, request.redirect_uri, negotiate_scopes(request.scope), request.state);
    decision.location = redirect_with(request.redirect_uri, {{"code", decision.code}}, request.state);
    return decision;
}

std::string AuthorizationCodeIssuer::issue(const std::string &subject, const Client &client,
                                           const std::string &redirect_uri,
                                           const std::vector<std::string> &scopes, const std::string &state)
{
    AuthorizationCode record;
    record.subject = subject;
    record.client_pk = client.id;
    record.redirect_uri = redirect_uri;
    record.scopes = scopes;
    record.state = state;
    record.issued_at = clock_();
    record.expires_at = record.issued_at + code_ttl_;

    for (int attempt = 0; attempt < 3; ++attempt)
    {
        std::string code = crypto::random_token(32);
        record.code_hash = hash_code(code);
        if (store_->insert_code(record))
            return code;
    }
    throw StoreError("无法持久化授权码");
}

CodeState AuthorizationCodeIssuer::state_of(const AuthorizationCode &code, long now)
{
    if (code.consumed_at)
        return CodeState::Consumed;
    if (now >= code.expires_at)
        return CodeState::Expired;
    return CodeState::Pending;
}

CodeState AuthorizationCodeIssuer::lookup(const std::string &code) const
{
    if (code.empty())
        return CodeState::Unknown;
    auto record = store_->find_code(hash_code(code));
    if (!record)
        return CodeState::Unknown;
    return state_of(*record, clock_());
}
