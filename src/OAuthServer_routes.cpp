#include "OAuthServer.hpp"
#include "Crypto.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

namespace
{
    struct ClientCredentials
    {
        std::string client_id;
        std::string client_secret;
        bool used_basic = false;
        bool malformed = false;
    };

    // client_secret_basic 优先，其次 client_secret_post；两种同时出现视为 invalid_request
    ClientCredentials extract_client_credentials(const HttpRequest &request,
                                                 const std::map<std::string, std::string> &form,
                                                 bool &conflict)
    {
        ClientCredentials credentials;
        conflict = false;

        std::string authorization = request.header("authorization");
        if (utils::starts_with(utils::to_lower(authorization), "basic "))
        {
            credentials.used_basic = true;
            std::string decoded;
            if (!crypto::base64_decode(utils::trim(authorization.substr(6)), decoded))
            {
                credentials.malformed = true;
                return credentials;
            }
            size_t colon = decoded.find(':');
            if (colon == std::string::npos)
            {
                credentials.malformed = true;
                return credentials;
            }
            credentials.client_id = utils::url_decode(decoded.substr(0, colon));
            credentials.client_secret = utils::url_decode(decoded.substr(colon + 1));
            conflict = form.count("client_secret") > 0;
            return credentials;
        }

        auto id = form.find("client_id");
        auto secret = form.find("client_secret");
        if (id != form.end())
            credentials.client_id = id->second;
        if (secret != form.end())
            credentials.client_secret = secret->second;
        return credentials;
    }

    std::string param(const std::map<std::string, std::string> &params, const std::string &name)
    {
        auto it = params.find(name);
        return it == params.end() ? "" : it->second;
    }

    HttpResponse method_not_allowed(const std::string &allow)
    {
        HttpResponse response = HttpResponse::json(405, {{"error", "invalid_request"}});
        response.set_header("Allow", allow);
        return response;
    }

    HttpResponse no_store(HttpResponse response)
    {
        response.set_header("Cache-Control", "no-store");
        response.set_header("Pragma", "no-cache");
        return response;
    }

    HttpResponse invalid_token()
    {
        HttpResponse response = HttpResponse::json(401, {{"error", "invalid_token"}});
        response.set_header("WWW-Authenticate", "Bearer error=\"invalid_token\"");
        return response;
    }

    bool has_scope(const std::vector<std::string> &scopes, const std::string &scope)
    {
        return std::find(scopes.begin(), scopes.end(), scope) != scopes.end();
    }
}

HttpResponse OAuthServer::oauth_error(OAuthError error, const std::string &description)
{
    nlohmann::json body;
    body["error"] = to_string(error);
    if (!description.empty())
        body["error_description"] = description;

    HttpResponse response = no_store(HttpResponse::json(error == OAuthError::InvalidClient ? 401 : 400, body));
    if (error == OAuthError::InvalidClient)
        response.set_header("WWW-Authenticate", "Basic realm=\"hub_oauth\"");
    return response;
}

HttpResponse OAuthServer::handle_discovery(const HttpRequest &request)
{
    if (request.method != "GET")
        return method_not_allowed("GET");

    std::string issuer = server_config_.issuer;
    while (utils::ends_with(issuer, "/"))
        issuer.pop_back();

    nlohmann::json document;
    document["issuer"] = issuer;
    document["authorization_endpoint"] = issuer + config::AUTHORIZE_PATH;
    document["token_endpoint"] = issuer + config::TOKEN_PATH;
    document["userinfo_endpoint"] = issuer + config::USERINFO_PATH;
    document["revocation_endpoint"] = issuer + config::REVOKE_PATH;
    document["scopes_supported"] = config::SUPPORTED_SCOPES;
    document["response_types_supported"] = {config::RESPONSE_TYPE_CODE};
    document["grant_types_supported"] = {config::GRANT_AUTHORIZATION_CODE, config::GRANT_REFRESH_TOKEN};
    document["token_endpoint_auth_methods_supported"] = {"client_secret_post", "client_secret_basic"};
    document["revocation_endpoint_auth_methods_supported"] = {"client_secret_post", "client_secret_basic"};
    return HttpResponse::json(200, document);
}

HttpResponse OAuthServer::handle_authorize(const HttpRequest &request)
{
    if (request.method != "GET")
        return method_not_allowed("GET");

    auto params = request.query_params();
    AuthorizationRequest authorization;
    authorization.response_type = param(params, "response_type");
    authorization.client_id = param(params, "client_id");
    authorization.redirect_uri = param(params, "redirect_uri");
    authorization.scope = param(params, "scope");
    authorization.state = param(params, "state");

    // 客户端和 redirect_uri 未通过校验时不能回跳
    auto client = codes_->validate_client(authorization);
    if (!client.ok())
    {
        std::cout << "🔑 authorize rejected client=" << authorization.client_id
                  << " result=" << to_string(client.error) << std::endl;
        return HttpResponse::json(400, {{"error", to_string(client.error)}});
    }

    std::optional<UserRecord> user;
    if (session_resolver_)
        user = session_resolver_(request);
    if (!user)
    {
        std::string back = request.path;
        if (!request.query.empty())
            back += "?" + request.query;
        return HttpResponse::redirect(utils::append_query(oauth_config_.login_path, {{"redirect_to", back}}));
    }

    AuthorizationDecision decision = codes_->authorize(*user, authorization);
    std::cout << "🔑 authorize client=" << authorization.client_id << " subject=" << user->id
              << " result=" << to_string(decision.error) << std::endl;

    if (decision.can_redirect)
        return HttpResponse::redirect(decision.location);
    return oauth_error(decision.error);
}

HttpResponse OAuthServer::handle_token(const HttpRequest &request)
{
    if (request.method != "POST")
        return method_not_allowed("POST");

    auto form = request.form_params();
    bool conflict = false;
    ClientCredentials credentials = extract_client_credentials(request, form, conflict);
    if (credentials.malformed)
        return oauth_error(OAuthError::InvalidClient);
    if (conflict)
        return oauth_error(OAuthError::InvalidRequest, "multiple client authentication methods");

    std::string grant_type = param(form, "grant_type");
    OAuthResult<IssuedTokens> result;

    if (grant_type == config::GRANT_AUTHORIZATION_CODE)
    {
        CodeExchangeRequest exchange;
        exchange.code = param(form, "code");
        exchange.redirect_uri = param(form, "redirect_uri");
        exchange.client_id = credentials.client_id;
        exchange.client_secret = credentials.client_secret;
        result = exchanger_->exchange(exchange);
    }
    else if (grant_type == config::GRANT_REFRESH_TOKEN)
    {
        RefreshRequest refresh;
        refresh.refresh_token = param(form, "refresh_token");
        refresh.client_id = credentials.client_id;
        refresh.client_secret = credentials.client_secret;
        result = refresher_->refresh(refresh);
    }
    else if (grant_type.empty())
    {
        result = OAuthResult<IssuedTokens>::failure(OAuthError::InvalidRequest);
    }
    else
    {
        result = OAuthResult<IssuedTokens>::failure(OAuthError::UnsupportedGrantType);
    }

    std::cout << "🎫 token grant=" << grant_type << " client=" << credentials.client_id
              << " result=" << to_string(result.error) << std::endl;

    if (!result.ok())
        return oauth_error(result.error);
    return no_store(HttpResponse::json(200, result.value.to_json()));
}

HttpResponse OAuthServer::handle_userinfo(const HttpRequest &request)
{
    if (request.method != "GET" && request.method != "POST")
        return method_not_allowed("GET, POST");

    std::string authorization = request.header("authorization");
    if (!utils::starts_with(utils::to_lower(authorization), "bearer "))
        return invalid_token();

    auto resolved = resolver_->resolve(utils::trim(authorization.substr(7)));
    if (!resolved)
        return invalid_token();

    auto user = store_->find_user(resolved->subject);
    if (!user || !user->active)
        return invalid_token();

    nlohmann::json info;
    info["sub"] = user->id;
    info["email"] = user->email;
    info["name"] = user->display_name;
    info["preferred_username"] = user->email;
    info["groups"] = user->group_names;
    // 组织信息只在 profile scope 下给出
    if (has_scope(resolved->scopes, "profile"))
    {
        info["department"] = user->department;
        info["job_title"] = user->job_title;
    }
    return no_store(HttpResponse::json(200, info));
}

HttpResponse OAuthServer::handle_revoke(const HttpRequest &request)
{
    if (request.method != "POST")
        return method_not_allowed("POST");

    auto form = request.form_params();
    bool conflict = false;
    ClientCredentials credentials = extract_client_credentials(request, form, conflict);
    if (credentials.malformed)
        return oauth_error(OAuthError::InvalidClient);
    if (conflict)
        return oauth_error(OAuthError::InvalidRequest, "multiple client authentication methods");

    OAuthError error = revoker_->revoke(credentials.client_id, credentials.client_secret,
                                        param(form, "token"), param(form, "token_type_hint"));
    if (error != OAuthError::None)
        return oauth_error(error);

    HttpResponse response;
    response.status = 200;
    return no_store(response);
}

HttpResponse OAuthServer::handle_sso_login(const HttpRequest &request)
{
    if (request.method != "GET")
        return method_not_allowed("GET");
    if (!discovery_)
        return HttpResponse::json(503, {{"error", "temporarily_unavailable"}});

    std::string redirect_to = safe_redirect_target(param(request.query_params(), "redirect_to"));

    // 随机数同时放进 state 和 cookie，回调时比对
    std::string nonce = crypto::random_token(32);
    std::string location = utils::append_query(discovery_->authorization_endpoint(),
                                               {{"client_id", upstream_config_.client_id},
                                                {"response_type", config::RESPONSE_TYPE_CODE},
                                                {"scope", upstream_config_.scopes},
                                                {"redirect_uri", upstream_config_.redirect_uri},
                                                {"state", nonce + "|" + redirect_to}});

    HttpResponse response = HttpResponse::redirect(location);
    response.add_header("Set-Cookie",
                        cookie_header(config::SSO_STATE_COOKIE, nonce, "/auth/sso", config::SSO_STATE_TTL));
    return response;
}

HttpResponse OAuthServer::handle_sso_callback(const HttpRequest &request)
{
    if (request.method != "GET")
        return method_not_allowed("GET");
    if (!upstream_exchange_)
        return HttpResponse::json(503, {{"error", "temporarily_unavailable"}});

    auto params = request.query_params();
    std::string upstream_error = param(params, "error");
    if (!upstream_error.empty())
    {
        std::cout << "🔐 上游拒绝登录: " << upstream_error << std::endl;
        return HttpResponse::json(400, {{"error", "access_denied"}});
    }

    std::string code = param(params, "code");
    std::string state = param(params, "state");
    if (code.empty() || state.empty())
        return HttpResponse::json(400, {{"error", "invalid_request"}});

    size_t bar = state.find('|');
    std::string nonce = state.substr(0, bar);
    std::string redirect_to = bar == std::string::npos ? "/" : state.substr(bar + 1);

    std::string expected = request.cookie(config::SSO_STATE_COOKIE);
    if (expected.empty() || !crypto::constant_time_equals(expected, nonce))
        return HttpResponse::json(400, {{"error", "invalid_request"}, {"error_description", "state mismatch"}});

    IdentityAssertion assertion = IdentityAssertion::from_claims(upstream_exchange_(code));
    UserRecord user = provisioner_->provision(assertion);
    if (!user.active)
    {
        std::cout << "🔐 已停用用户尝试登录: " << user.id << std::endl;
        return HttpResponse::json(403, {{"error", "access_denied"}});
    }

    std::string session =
        make_session_token(user.id, oauth_config_.signing_secret, clock_(), oauth_config_.session_ttl);
    std::cout << "🔐 SSO 登录成功 subject=" << user.id << std::endl;

    HttpResponse response = HttpResponse::redirect(safe_redirect_target(redirect_to));
    response.add_header("Set-Cookie",
                        cookie_header(oauth_config_.session_cookie, session, "/", oauth_config_.session_ttl));
    response.add_header("Set-Cookie", cookie_header(config::SSO_STATE_COOKIE, "", "/auth/sso", 0));
    return no_store(response);
}

HttpResponse OAuthServer::handle_logout(const HttpRequest &request)
{
    if (request.method != "POST")
        return method_not_allowed("POST");

    HttpResponse response = HttpResponse::json(200, {{"message", "logged out"}});
    response.add_header("Set-Cookie", cookie_header(oauth_config_.session_cookie, "", "/", 0));
    return no_store(response);
}

HttpResponse OAuthServer::handle_health(const HttpRequest &request)
{
    if (request.method != "GET")
        return method_not_allowed("GET");
    return HttpResponse::json(200, get_status());
}
