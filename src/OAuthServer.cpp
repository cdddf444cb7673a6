#include "OAuthServer.hpp"
#include "Crypto.hpp"
#include "Jwt.hpp"
#include "UpstreamTokenClient.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>

// HTTP服务器简单实现（基于socket）
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace
{
    // 请求头中 Content-Length 的值；缺失时为 0，非法时返回 false
    bool content_length_of(const std::string &raw, size_t header_end, size_t &length)
    {
        length = 0;
        HttpRequest head;
        if (!HttpRequest::parse(raw.substr(0, header_end + 4), head))
            return false;

        std::string value = head.header("content-length");
        if (value.empty())
            return true;
        if (value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9)
            return false;
        length = static_cast<size_t>(std::stoul(value));
        return true;
    }

    bool send_all(int fd, const std::string &data)
    {
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }
}

OAuthServer::OAuthServer(const ConfigManager &config, std::shared_ptr<OAuthStore> store,
                         std::shared_ptr<UpstreamDiscovery> discovery, Clock clock)
    : server_config_(config.get_server_config()), oauth_config_(config.get_oauth_config()),
      upstream_config_(config.get_upstream_config()), clock_(std::move(clock)), store_(std::move(store)),
      discovery_(std::move(discovery)), running_(false), server_fd_(-1), handled_requests_(0)
{
    clients_ = std::make_shared<ClientRegistry>(store_, clock_);
    access_ = std::make_shared<AccessEvaluator>(store_);
    codes_ = std::make_shared<AuthorizationCodeIssuer>(store_, clients_, access_, clock_, oauth_config_.code_ttl);

    TokenSettings settings;
    settings.signing_secret = oauth_config_.signing_secret;
    settings.issuer = server_config_.issuer;
    settings.access_token_ttl = oauth_config_.access_token_ttl;
    settings.refresh_token_ttl = oauth_config_.refresh_token_ttl;
    tokens_ = std::make_shared<TokenIssuer>(store_, settings, clock_);

    exchanger_ = std::make_shared<CodeExchanger>(store_, clients_, tokens_, clock_);
    refresher_ = std::make_shared<TokenRefresher>(store_, clients_, tokens_, clock_);
    resolver_ = std::make_shared<TokenResolver>(store_, oauth_config_.signing_secret, clock_);
    revoker_ = std::make_shared<TokenRevoker>(store_, clients_, resolver_, clock_);
    provisioner_ = std::make_shared<IdentityProvisioner>(store_, clock_);

    if (discovery_)
    {
        auto upstream = std::make_shared<UpstreamTokenClient>(
            discovery_, upstream_config_, UpstreamTokenClient::curl_poster(upstream_config_.request_timeout));
        upstream_exchange_ = [upstream](const std::string &code)
        { return upstream->exchange_code(code); };
    }

    session_resolver_ = [this](const HttpRequest &request)
    { return resolve_session_cookie(request); };
}

OAuthServer::~OAuthServer()
{
    stop();
    workers_.shutdown();
}

void OAuthServer::set_session_resolver(SessionResolver resolver)
{
    session_resolver_ = std::move(resolver);
}

void OAuthServer::set_upstream_code_exchange(UpstreamCodeExchange exchange)
{
    upstream_exchange_ = std::move(exchange);
}

bool OAuthServer::start()
{
    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0)
    {
        std::cerr << "❌ socket创建失败: " << strerror(errno) << std::endl;
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)))
    {
        std::cerr << "❌ setsockopt失败: " << strerror(errno) << std::endl;
        close(server_fd);
        return false;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(server_config_.port));
    if (inet_pton(AF_INET, server_config_.host.c_str(), &address.sin_addr) != 1)
    {
        std::cerr << "❌ 无效的监听地址: " << server_config_.host << std::endl;
        close(server_fd);
        return false;
    }

    if (bind(server_fd, (struct sockaddr *)&address, sizeof(address)) < 0)
    {
        std::cerr << "❌ 绑定失败: " << strerror(errno) << std::endl;
        close(server_fd);
        return false;
    }

    if (listen(server_fd, SOMAXCONN) < 0)
    {
        std::cerr << "❌ 监听失败: " << strerror(errno) << std::endl;
        close(server_fd);
        return false;
    }

    server_fd_ = server_fd;
    running_ = true;
    workers_.initialize(server_config_.worker_threads);

    std::cout << "🚀 OAuth 服务已启动，监听地址: " << server_config_.host << ":" << server_config_.port << std::endl;
    std::cout << "📋 可用路由:" << std::endl;
    std::cout << "   - GET  " << config::DISCOVERY_PATH << std::endl;
    std::cout << "   - GET  " << config::AUTHORIZE_PATH << std::endl;
    std::cout << "   - POST " << config::TOKEN_PATH << std::endl;
    std::cout << "   - GET  " << config::USERINFO_PATH << std::endl;
    std::cout << "   - POST " << config::REVOKE_PATH << std::endl;
    std::cout << "   - GET  " << config::SSO_LOGIN_PATH << std::endl;
    std::cout << "   - GET  " << config::SSO_CALLBACK_PATH << std::endl;
    std::cout << "   - POST " << config::LOGOUT_PATH << std::endl;
    std::cout << "   - GET  " << config::HEALTH_PATH << std::endl;

    // 主循环：poll 带超时，以便及时响应 stop()
    while (running_)
    {
        struct pollfd pfd;
        pfd.fd = server_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, 500);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            std::cerr << "❌ poll失败: " << strerror(errno) << std::endl;
            break;
        }
        if (ready == 0)
            continue;

        int client_fd = accept(server_fd, nullptr, nullptr);
        if (client_fd < 0)
        {
            if (errno != EINTR && errno != EAGAIN)
                std::cerr << "❌ 接受连接失败: " << strerror(errno) << std::endl;
            continue;
        }

        Task task;
        task.id = "conn-" + std::to_string(client_fd);
        task.job = [this, client_fd]()
        { handle_connection(client_fd); };
        if (!workers_.addTask(std::move(task)))
            close(client_fd);
    }

    running_ = false;
    server_fd_ = -1;
    close(server_fd);
    workers_.shutdown();
    std::cout << "🛑 OAuth 服务已停止" << std::endl;
    return true;
}

void OAuthServer::stop()
{
    // 只写原子标志，可在信号处理函数中调用
    running_ = false;
}

void OAuthServer::handle_connection(int client_fd)
{
    struct timeval timeout;
    timeout.tv_sec = 10;
    timeout.tv_usec = 0;
    if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0)
        std::cerr << "⚠️  设置接收超时失败: " << strerror(errno) << std::endl;

    std::string raw;
    char buffer[4096];
    size_t header_end = std::string::npos;
    size_t content_length = 0;
    HttpResponse response;
    bool complete = false;

    while (raw.size() <= config::MAX_REQUEST_BYTES)
    {
        ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        raw.append(buffer, static_cast<size_t>(n));

        if (header_end == std::string::npos)
        {
            header_end = raw.find("\r\n\r\n");
            if (header_end == std::string::npos)
                continue;
            if (!content_length_of(raw, header_end, content_length))
            {
                response = HttpResponse::json(400, {{"error", "invalid_request"}});
                break;
            }
            if (header_end + 4 + content_length > config::MAX_REQUEST_BYTES)
            {
                response = HttpResponse::json(413, {{"error", "invalid_request"}});
                break;
            }
        }

        if (raw.size() >= header_end + 4 + content_length)
        {
            complete = true;
            break;
        }
    }

    if (complete)
    {
        HttpRequest request;
        if (HttpRequest::parse(raw, request))
        {
            request.body.resize(content_length);
            response = process_request(request);
            std::cout << "📥 " << request.method << " " << request.path << " -> " << response.status << std::endl;
        }
        else
        {
            response = HttpResponse::json(400, {{"error", "invalid_request"}});
        }
    }
    else if (response.status == 200)
    {
        // 连接提前关闭、超时或超出大小
        response = HttpResponse::json(raw.size() > config::MAX_REQUEST_BYTES ? 413 : 400,
                                      {{"error", "invalid_request"}});
    }

    if (!send_all(client_fd, response.serialize()))
        std::cerr << "❌ 发送响应失败: " << strerror(errno) << std::endl;
    close(client_fd);
}

HttpResponse OAuthServer::process_request(const HttpRequest &request)
{
    handled_requests_++;

    try
    {
        if (request.path == config::DISCOVERY_PATH)
            return handle_discovery(request);
        if (request.path == config::AUTHORIZE_PATH)
            return handle_authorize(request);
        if (request.path == config::TOKEN_PATH)
            return handle_token(request);
        if (request.path == config::USERINFO_PATH)
            return handle_userinfo(request);
        if (request.path == config::REVOKE_PATH)
            return handle_revoke(request);
        if (request.path == config::SSO_LOGIN_PATH)
            return handle_sso_login(request);
        if (request.path == config::SSO_CALLBACK_PATH)
            return handle_sso_callback(request);
        if (request.path == config::LOGOUT_PATH)
            return handle_logout(request);
        if (request.path == config::HEALTH_PATH)
            return handle_health(request);

        return HttpResponse::json(404, {{"error", "not_found"}});
    }
    catch (const UpstreamError &e)
    {
        std::cerr << "❌ 上游身份源错误: " << e.what() << std::endl;
        return HttpResponse::json(502, {{"error", "temporarily_unavailable"},
                                        {"error_description", "identity provider unavailable"}});
    }
    catch (const StoreError &e)
    {
        std::cerr << "❌ 存储错误: " << e.what() << std::endl;
        return HttpResponse::json(500, {{"error", "server_error"}});
    }
    catch (const std::exception &e)
    {
        std::cerr << "❌ 处理请求异常: " << e.what() << std::endl;
        return HttpResponse::json(500, {{"error", "server_error"}});
    }
}

nlohmann::json OAuthServer::get_status()
{
    nlohmann::json status;
    status["status"] = "ok";
    status["issuer"] = server_config_.issuer;
    status["running"] = running_.load();
    status["handled_requests"] = handled_requests_.load();
    status["pending_connections"] = workers_.getPendingTaskCount();
    status["active_workers"] = workers_.getActiveThreadCount();
    status["failed_connections"] = workers_.getFailedTaskCount();
    status["timestamp"] = utils::get_formatted_timestamp();
    return status;
}

std::optional<UserRecord> OAuthServer::resolve_session_cookie(const HttpRequest &request) const
{
    std::string token = request.cookie(oauth_config_.session_cookie);
    if (token.empty())
        return std::nullopt;

    nlohmann::json claims;
    if (!jwt::VerifyToken(token, oauth_config_.signing_secret, clock_(), claims))
        return std::nullopt;
    if (claims.value("type", "") != "session" || !claims.contains("sub") || !claims["sub"].is_string())
        return std::nullopt;

    return store_->find_user(claims["sub"].get<std::string>());
}

std::string OAuthServer::cookie_header(const std::string &name, const std::string &value, const std::string &path,
                                       long max_age) const
{
    std::string header = name + "=" + value + "; Path=" + path + "; Max-Age=" + std::to_string(max_age) +
                         "; HttpOnly; SameSite=Lax";
    if (utils::starts_with(server_config_.issuer, "https://"))
        header += "; Secure";
    return header;
}

std::string OAuthServer::safe_redirect_target(const std::string &target)
{
    if (target.empty() || target[0] != '/' || utils::starts_with(target, "//"))
        return "/";
    for (char c : target)
    {
        // 反斜杠会被部分浏览器当作 "/"；控制字符可拆分响应头
        if (c == '\\' || static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            return "/";
    }
    return target;
}

std::string OAuthServer::make_session_token(const std::string &subject, const std::string &secret, long now, long ttl)
{
    nlohmann::json claims;
    claims["sub"] = subject;
    claims["type"] = "session";
    claims["iat"] = now;
    claims["exp"] = now + ttl;
    claims["jti"] = crypto::random_hex();
    return jwt::GenerateToken(claims, secret);
}
