#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "AccessEvaluator.hpp"
#include "AuthorizationCodeIssuer.hpp"
#include "ClientRegistry.hpp"
#include "CodeExchanger.hpp"
#include "ConfigManager.hpp"
#include "HttpMessage.hpp"
#include "IdentityProvisioner.hpp"
#include "OAuthStore.hpp"
#include "TaskManager.hpp"
#include "TokenIssuer.hpp"
#include "TokenRefresher.hpp"
#include "TokenResolver.hpp"
#include "UpstreamDiscovery.hpp"

// 从请求中识别已登录的终端用户；未登录返回空
using SessionResolver = std::function<std::optional<UserRecord>(const HttpRequest &)>;

// 用上游授权码换取身份声明；失败时抛出 UpstreamError
using UpstreamCodeExchange = std::function<nlohmann::json(const std::string &code)>;

class OAuthServer
{
private:
    ServerConfig server_config_;
    OAuthConfig oauth_config_;
    UpstreamConfig upstream_config_;
    Clock clock_;

    std::shared_ptr<OAuthStore> store_;
    std::shared_ptr<UpstreamDiscovery> discovery_;
    std::shared_ptr<ClientRegistry> clients_;
    std::shared_ptr<AccessEvaluator> access_;
    std::shared_ptr<AuthorizationCodeIssuer> codes_;
    std::shared_ptr<TokenIssuer> tokens_;
    std::shared_ptr<CodeExchanger> exchanger_;
    std::shared_ptr<TokenRefresher> refresher_;
    std::shared_ptr<TokenResolver> resolver_;
    std::shared_ptr<TokenRevoker> revoker_;
    std::shared_ptr<IdentityProvisioner> provisioner_;
    SessionResolver session_resolver_;
    UpstreamCodeExchange upstream_exchange_;

    TaskManager workers_;
    std::atomic<bool> running_;
    std::atomic<int> server_fd_;
    std::atomic<size_t> handled_requests_;

    // 读取完整请求并写回响应，在工作线程中执行
    void handle_connection(int client_fd);

    // 路由处理
    HttpResponse handle_discovery(const HttpRequest &request);
    HttpResponse handle_authorize(const HttpRequest &request);
    HttpResponse handle_token(const HttpRequest &request);
    HttpResponse handle_userinfo(const HttpRequest &request);
    HttpResponse handle_revoke(const HttpRequest &request);
    HttpResponse handle_sso_login(const HttpRequest &request);
    HttpResponse handle_sso_callback(const HttpRequest &request);
    HttpResponse handle_logout(const HttpRequest &request);
    HttpResponse handle_health(const HttpRequest &request);

    // OAuth 错误响应：invalid_client 为 401，其余 400
    static HttpResponse oauth_error(OAuthError error, const std::string &description = "");

    // 默认会话解析：校验 session cookie（HS256 JWT，type=session）
    std::optional<UserRecord> resolve_session_cookie(const HttpRequest &request) const;

    // HttpOnly + SameSite=Lax，issuer 为 https 时加 Secure；max_age 为 0 表示删除
    std::string cookie_header(const std::string &name, const std::string &value, const std::string &path,
                              long max_age) const;

public:
    OAuthServer(const ConfigManager &config, std::shared_ptr<OAuthStore> store,
                std::shared_ptr<UpstreamDiscovery> discovery, Clock clock = system_clock());

    ~OAuthServer();

    // 替换 /oauth/authorize 的登录态识别
    void set_session_resolver(SessionResolver resolver);

    // 替换 /auth/sso/callback 的上游换码；默认经 libcurl 调用上游 token 端点
    void set_upstream_code_exchange(UpstreamCodeExchange exchange);

    // 监听并阻塞处理连接，直到 stop()；监听失败返回 false
    bool start();

    void stop();

    // 路由入口，不涉及 socket，便于测试
    HttpResponse process_request(const HttpRequest &request);

    nlohmann::json get_status();

    std::shared_ptr<ClientRegistry> clients() const { return clients_; }
    std::shared_ptr<AccessEvaluator> access() const { return access_; }

    // 登录后只允许跳回本站相对路径，其余一律回到 "/"
    static std::string safe_redirect_target(const std::string &target);

    // 为用户签发会话 cookie 的值
    static std::string make_session_token(const std::string &subject, const std::string &secret, long now, long ttl);
};
