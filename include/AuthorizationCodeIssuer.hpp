#pragma once

#include <memory>
#include <string>
#include <vector>
#include "AccessEvaluator.hpp"
#include "ClientRegistry.hpp"
#include "OAuthStore.hpp"

// /authorize 的查询参数
struct AuthorizationRequest
{
    std::string response_type;
    std::string client_id;
    std::string redirect_uri;
    std::string scope;
    std::string state;
};

// 授权结果。error 非 None 且 can_redirect 为 false 时，调用方不得重定向
// （客户端或 redirect_uri 未经验证），直接返回错误页
struct AuthorizationDecision
{
    OAuthError error = OAuthError::None;
    bool can_redirect = false;
    std::string location; // can_redirect 时的完整重定向地址
    std::string code;     // 成功时的明文授权码

    bool ok() const { return error == OAuthError::None; }
};

// 授权码状态机：PENDING -> CONSUMED | EXPIRED。
// EXPIRED 在查询时惰性判定，不依赖后台清理
class AuthorizationCodeIssuer
{
public:
    AuthorizationCodeIssuer(std::shared_ptr<OAuthStore> store,
                            std::shared_ptr<ClientRegistry> clients,
                            std::shared_ptr<AccessEvaluator> access,
                            Clock clock, long code_ttl);

    // 只校验 client_id 和 redirect_uri，决定错误能否回跳给客户端
    OAuthResult<Client> validate_client(const AuthorizationRequest &request) const;

    // 已认证用户发起授权：校验客户端、response_type、访问策略后铸造授权码
    AuthorizationDecision authorize(const UserRecord &principal, const AuthorizationRequest &request);

    CodeState lookup(const std::string &code) const;

    static CodeState state_of(const AuthorizationCode &code, long now);

    // 按空格拆分，去重，只保留支持的 scope；结果为空时取默认 openid
    static std::vector<std::string> negotiate_scopes(const std::string &scope);

    static std::string hash_code(const std::string &code);

private:
    std::string issue(const std::string &subject, const Client &client, const std::string &redirect_uri,
                      const std::vector<std::string> &scopes, const std::string &state);

    static std::string redirect_with(const std::string &redirect_uri,
                                     std::vector<std::pair<std::string, std::string>> params,
                                     const std::string &state);

    std::shared_ptr<OAuthStore> store_;
    std::shared_ptr<ClientRegistry> clients_;
    std::shared_ptr<AccessEvaluator> access_;
    Clock clock_;
    long code_ttl_;
};
