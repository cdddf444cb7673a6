#include <gtest/gtest.h>
#include "OAuthServer.hpp"
#include "TestSupport.hpp"
#include "config.hpp"
#include "utils.hpp"

using namespace testing_support;

namespace
{
    HttpRequest get(const std::string &path, const std::string &query = "")
    {
        HttpRequest request;
        request.method = "GET";
        request.path = path;
        request.query = query;
        return request;
    }

    HttpRequest post_form(const std::string &path, const std::vector<std::pair<std::string, std::string>> &form)
    {
        HttpRequest request;
        request.method = "POST";
        request.path = path;
        request.headers["content-type"] = "application/x-www-form-urlencoded";
        request.body = utils::build_query(form);
        return request;
    }

    std::map<std::string, std::string> location_params(const HttpResponse &response)
    {
        std::string location = response.header("Location");
        auto pos = location.find('?');
        return pos == std::string::npos ? std::map<std::string, std::string>() : utils::parse_form(location.substr(pos + 1));
    }

    // 跟随站内跳转
    HttpRequest follow(const HttpResponse &response)
    {
        std::string location = response.header("Location");
        auto pos = location.find('?');
        if (pos == std::string::npos)
            return get(location);
        return get(location.substr(0, pos), location.substr(pos + 1));
    }

    // 响应中某个 Set-Cookie 的值；未设置时返回 "<unset>"
    std::string set_cookie_value(const HttpResponse &response, const std::string &name)
    {
        for (const auto &header : response.header_values("Set-Cookie"))
        {
            if (utils::starts_with(header, name + "="))
                return header.substr(name.size() + 1, header.find(';') - name.size() - 1);
        }
        return "<unset>";
    }

    std::string set_cookie_header(const HttpResponse &response, const std::string &name)
    {
        for (const auto &header : response.header_values("Set-Cookie"))
        {
            if (utils::starts_with(header, name + "="))
                return header;
        }
        return "";
    }
}

class OAuthServerTest : public ::testing::Test
{
protected:
    FakeClock time;
    std::shared_ptr<MemoryOAuthStore> store = std::make_shared<MemoryOAuthStore>();
    ConfigManager config{"/nonexistent/hub_config.json"};
    std::unique_ptr<OAuthServer> server;
    RegisteredClient wiki;
    UserRecord alice;
    std::string session_cookie;

    int fetch_count = 0;
    bool upstream_down = false;

    std::vector<std::string> exchanged_codes;
    nlohmann::json upstream_claims = {{"sub", "adfs-carol"},
                                      {"email", "carol@example.com"},
                                      {"name", "Carol"},
                                      {"department", "Finance"},
                                      {"groups", nlohmann::json::array({"staff", "finance"})}};

    void SetUp() override
    {
        ServerConfig server_config;
        server_config.issuer = "https://hub.example.com";
        config.set_server_config(server_config);

        OAuthConfig oauth;
        oauth.signing_secret = SIGNING_SECRET;
        config.set_oauth_config(oauth);

        UpstreamConfig upstream;
        upstream.discovery_url = "https://adfs.example.com/.well-known/openid-configuration";
        upstream.client_id = "hub-upstream";
        upstream.redirect_uri = "https://hub.example.com/auth/sso/callback";
        config.set_upstream_config(upstream);

        auto discovery = std::make_shared<UpstreamDiscovery>(
            upstream.discovery_url, 300,
            [this](const std::string &)
            {
                ++fetch_count;
                if (upstream_down)
                    throw UpstreamError("connection refused");
                return nlohmann::json({{"authorization_endpoint", "https://adfs.example.com/authorize"},
                                       {"token_endpoint", "https://adfs.example.com/token"}})
                    .dump();
            },
            time.clock());

        server = std::make_unique<OAuthServer>(config, store, discovery, time.clock());
        server->set_upstream_code_exchange(
            [this](const std::string &code)
            {
                exchanged_codes.push_back(code);
                return upstream_claims;
            });
        wiki = server->clients()->register_client("Wiki", {REDIRECT_URI});
        alice = add_user(*store, "alice");
        grant(*store, DirectPrincipal{"alice"}, wiki.client);

        session_cookie = "hub_session=" + OAuthServer::make_session_token("alice", SIGNING_SECRET, time.get(), 3600);
    }

    std::string authorize_query(const std::string &scope = "openid", const std::string &client_id = "")
    {
        return utils::build_query({{"response_type", "code"},
                                   {"client_id", client_id.empty() ? wiki.client.client_id : client_id},
                                   {"redirect_uri", REDIRECT_URI},
                                   {"scope", scope},
                                   {"state", "st-1"}});
    }

    std::string obtain_code(const std::string &scope = "openid")
    {
        HttpRequest request = get(config::AUTHORIZE_PATH, authorize_query(scope));
        request.headers["cookie"] = "theme=dark; " + session_cookie;
        HttpResponse response = server->process_request(request);
        EXPECT_EQ(response.status, 302);
        return location_params(response)["code"];
    }

    // 模拟上游回调，state 随机数与 cookie 一致
    HttpResponse sso_callback(const std::string &redirect_to, const std::string &code = "upstream-code")
    {
        HttpRequest request = get(config::SSO_CALLBACK_PATH,
                                  utils::build_query({{"code", code}, {"state", "nonce-1|" + redirect_to}}));
        request.headers["cookie"] = config::SSO_STATE_COOKIE + "=nonce-1";
        return server->process_request(request);
    }

    nlohmann::json exchange(const std::string &code)
    {
        HttpResponse response = server->process_request(post_form(config::TOKEN_PATH, {{"grant_type", "authorization_code"},
                                                                                       {"code", code},
                                                                                       {"redirect_uri", REDIRECT_URI},
                                                                                       {"client_id", wiki.client.client_id},
                                                                                       {"client_secret", wiki.client_secret}}));
        EXPECT_EQ(response.status, 200) << response.body;
        return nlohmann::json::parse(response.body);
    }
};

TEST_F(OAuthServerTest, DiscoveryDocument)
{
    HttpResponse response = server->process_request(get(config::DISCOVERY_PATH));
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Type"), "application/json");

    auto doc = nlohmann::json::parse(response.body);
    EXPECT_EQ(doc["issuer"], "https://hub.example.com");
    EXPECT_EQ(doc["authorization_endpoint"], "https://hub.example.com/oauth/authorize");
    EXPECT_EQ(doc["token_endpoint"], "https://hub.example.com/oauth/token");
    EXPECT_EQ(doc["revocation_endpoint"], "https://hub.example.com/oauth/revoke");
    EXPECT_EQ(doc["response_types_supported"], nlohmann::json::array({"code"}));
    EXPECT_EQ(doc["scopes_supported"], nlohmann::json::array({"openid", "profile", "email"}));
    // 不签发 id_token，不声明相关能力
    EXPECT_FALSE(doc.contains("id_token_signing_alg_values_supported"));
    EXPECT_FALSE(doc.contains("subject_types_supported"));
}

TEST_F(OAuthServerTest, AuthorizeWithoutSessionRedirectsToLogin)
{
    HttpResponse response = server->process_request(get(config::AUTHORIZE_PATH, authorize_query()));
    ASSERT_EQ(response.status, 302);
    std::string location = response.header("Location");
    EXPECT_TRUE(utils::starts_with(location, config::SSO_LOGIN_PATH + "?redirect_to="));
    EXPECT_EQ(location_params(response)["redirect_to"], config::AUTHORIZE_PATH + "?" + authorize_query());
}

TEST_F(OAuthServerTest, AuthorizeWithExpiredSessionRedirectsToLogin)
{
    time.advance(3600);
    HttpRequest request = get(config::AUTHORIZE_PATH, authorize_query());
    request.headers["cookie"] = session_cookie;
    HttpResponse response = server->process_request(request);
    ASSERT_EQ(response.status, 302);
    EXPECT_TRUE(utils::starts_with(response.header("Location"), config::SSO_LOGIN_PATH));
}

TEST_F(OAuthServerTest, AuthorizeUnknownClientIsNotRedirected)
{
    HttpRequest request = get(config::AUTHORIZE_PATH, authorize_query("openid", "hub_unknown"));
    request.headers["cookie"] = session_cookie;
    HttpResponse response = server->process_request(request);
    ASSERT_EQ(response.status, 400);
    EXPECT_TRUE(response.header("Location").empty());
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "invalid_client");
}

TEST_F(OAuthServerTest, AuthorizeDeniedRedirectsWithError)
{
    add_user(*store, "bob");
    server->set_session_resolver([this](const HttpRequest &) { return store->find_user("bob"); });

    HttpResponse response = server->process_request(get(config::AUTHORIZE_PATH, authorize_query()));
    ASSERT_EQ(response.status, 302);
    auto params = location_params(response);
    EXPECT_EQ(params["error"], "access_denied");
    EXPECT_EQ(params["state"], "st-1");
}

TEST_F(OAuthServerTest, FullCodeFlowWithPostCredentials)
{
    std::string code = obtain_code("openid email profile");
    ASSERT_FALSE(code.empty());

    HttpResponse response = server->process_request(post_form(config::TOKEN_PATH, {{"grant_type", "authorization_code"},
                                                                                   {"code", code},
                                                                                   {"redirect_uri", REDIRECT_URI},
                                                                                   {"client_id", wiki.client.client_id},
                                                                                   {"client_secret", wiki.client_secret}}));
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(response.header("Cache-Control"), "no-store");
    EXPECT_EQ(response.header("Pragma"), "no-cache");

    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ(body["token_type"], "Bearer");
    EXPECT_EQ(body["expires_in"], 3600);
    EXPECT_EQ(body["scope"], "openid email profile");

    HttpRequest userinfo = get(config::USERINFO_PATH);
    userinfo.headers["authorization"] = "Bearer " + body["access_token"].get<std::string>();
    HttpResponse info = server->process_request(userinfo);
    ASSERT_EQ(info.status, 200);
    auto claims = nlohmann::json::parse(info.body);
    EXPECT_EQ(claims["sub"], "alice");
    EXPECT_EQ(claims["email"], "alice@example.com");
    EXPECT_EQ(claims["department"], "R&D");
    EXPECT_EQ(claims["groups"], nlohmann::json::array({"staff"}));
}

TEST_F(OAuthServerTest, BasicAuthenticationAndRefresh)
{
    auto first = exchange(obtain_code());

    HttpRequest request = post_form(config::TOKEN_PATH, {{"grant_type", "refresh_token"},
                                                         {"refresh_token", first["refresh_token"].get<std::string>()}});
    request.headers["authorization"] =
        "Basic " + crypto::base64_encode(wiki.client.client_id + ":" + wiki.client_secret);
    HttpResponse response = server->process_request(request);
    ASSERT_EQ(response.status, 200) << response.body;

    auto second = nlohmann::json::parse(response.body);
    EXPECT_NE(second["refresh_token"], first["refresh_token"]);
    EXPECT_EQ(second["scope"], first["scope"]);

    HttpResponse replay = server->process_request(request);
    EXPECT_EQ(replay.status, 400);
    EXPECT_EQ(nlohmann::json::parse(replay.body)["error"], "invalid_grant");
}

TEST_F(OAuthServerTest, InvalidClientGets401WithChallenge)
{
    std::string code = obtain_code();
    HttpResponse response = server->process_request(post_form(config::TOKEN_PATH, {{"grant_type", "authorization_code"},
                                                                                   {"code", code},
                                                                                   {"redirect_uri", REDIRECT_URI},
                                                                                   {"client_id", wiki.client.client_id},
                                                                                   {"client_secret", "wrong"}}));
    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(response.header("WWW-Authenticate"), "Basic realm=\"hub_oauth\"");
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "invalid_client");

    HttpRequest malformed = post_form(config::TOKEN_PATH, {{"grant_type", "authorization_code"}, {"code", code}});
    malformed.headers["authorization"] = "Basic !!!";
    EXPECT_EQ(server->process_request(malformed).status, 401);
}

TEST_F(OAuthServerTest, ConflictingClientAuthenticationIsRejected)
{
    HttpRequest request = post_form(config::TOKEN_PATH, {{"grant_type", "refresh_token"},
                                                         {"refresh_token", "x"},
                                                         {"client_secret", wiki.client_secret}});
    request.headers["authorization"] =
        "Basic " + crypto::base64_encode(wiki.client.client_id + ":" + wiki.client_secret);
    HttpResponse response = server->process_request(request);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "invalid_request");
}

TEST_F(OAuthServerTest, GrantTypeErrors)
{
    HttpResponse unsupported = server->process_request(post_form(config::TOKEN_PATH, {{"grant_type", "password"}}));
    EXPECT_EQ(unsupported.status, 400);
    EXPECT_EQ(nlohmann::json::parse(unsupported.body)["error"], "unsupported_grant_type");

    HttpResponse missing = server->process_request(post_form(config::TOKEN_PATH, {}));
    EXPECT_EQ(missing.status, 400);
    EXPECT_EQ(nlohmann::json::parse(missing.body)["error"], "invalid_request");
}

TEST_F(OAuthServerTest, UserinfoRequiresBearerToken)
{
    HttpResponse missing = server->process_request(get(config::USERINFO_PATH));
    EXPECT_EQ(missing.status, 401);
    EXPECT_EQ(missing.header("WWW-Authenticate"), "Bearer error=\"invalid_token\"");

    HttpRequest garbage = get(config::USERINFO_PATH);
    garbage.headers["authorization"] = "Bearer not-a-token";
    EXPECT_EQ(server->process_request(garbage).status, 401);
}

TEST_F(OAuthServerTest, UserinfoReturnsStandardClaimsForOpenidScope)
{
    auto tokens = exchange(obtain_code("openid"));
    HttpRequest request = get(config::USERINFO_PATH);
    request.headers["authorization"] = "Bearer " + tokens["access_token"].get<std::string>();
    HttpResponse response = server->process_request(request);
    ASSERT_EQ(response.status, 200);

    auto claims = nlohmann::json::parse(response.body);
    EXPECT_EQ(claims["sub"], "alice");
    EXPECT_EQ(claims["email"], "alice@example.com");
    EXPECT_EQ(claims["name"], "User alice");
    EXPECT_EQ(claims["preferred_username"], "alice@example.com");
    EXPECT_EQ(claims["groups"], nlohmann::json::array({"staff"}));
    EXPECT_FALSE(claims.contains("department"));
}

TEST_F(OAuthServerTest, RevokeEndpointInvalidatesTokens)
{
    auto tokens = exchange(obtain_code());
    HttpResponse response = server->process_request(post_form(config::REVOKE_PATH, {{"token", tokens["access_token"].get<std::string>()},
                                                                                    {"token_type_hint", "access_token"},
                                                                                    {"client_id", wiki.client.client_id},
                                                                                    {"client_secret", wiki.client_secret}}));
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.body.empty());

    HttpRequest userinfo = get(config::USERINFO_PATH);
    userinfo.headers["authorization"] = "Bearer " + tokens["access_token"].get<std::string>();
    EXPECT_EQ(server->process_request(userinfo).status, 401);

    HttpResponse unknown = server->process_request(post_form(config::REVOKE_PATH, {{"token", "never-issued"},
                                                                                   {"client_id", wiki.client.client_id},
                                                                                   {"client_secret", wiki.client_secret}}));
    EXPECT_EQ(unknown.status, 200);

    HttpResponse unauthenticated = server->process_request(post_form(config::REVOKE_PATH, {{"token", "x"},
                                                                                           {"client_id", wiki.client.client_id}}));
    EXPECT_EQ(unauthenticated.status, 401);
}

TEST_F(OAuthServerTest, SsoLoginRedirectsUpstream)
{
    HttpResponse response = server->process_request(get(config::SSO_LOGIN_PATH, "redirect_to=%2Foauth%2Fauthorize%3Fx%3D1"));
    ASSERT_EQ(response.status, 302);
    EXPECT_TRUE(utils::starts_with(response.header("Location"), "https://adfs.example.com/authorize?"));

    auto params = location_params(response);
    EXPECT_EQ(params["client_id"], "hub-upstream");
    EXPECT_EQ(params["response_type"], "code");
    EXPECT_EQ(params["redirect_uri"], "https://hub.example.com/auth/sso/callback");
    EXPECT_TRUE(utils::ends_with(params["state"], "|/oauth/authorize?x=1"));
    EXPECT_EQ(fetch_count, 1);

    std::string nonce = params["state"].substr(0, params["state"].find('|'));
    EXPECT_EQ(set_cookie_value(response, config::SSO_STATE_COOKIE), nonce);
    std::string cookie = set_cookie_header(response, config::SSO_STATE_COOKIE);
    EXPECT_NE(cookie.find("HttpOnly"), std::string::npos);
    EXPECT_NE(cookie.find("Path=/auth/sso"), std::string::npos);
}

TEST_F(OAuthServerTest, SsoLoginDropsExternalRedirectTarget)
{
    HttpResponse response =
        server->process_request(get(config::SSO_LOGIN_PATH, "redirect_to=https%3A%2F%2Fevil.example.com%2F"));
    ASSERT_EQ(response.status, 302);
    EXPECT_TRUE(utils::ends_with(location_params(response)["state"], "|/"));
}

TEST_F(OAuthServerTest, SsoLoginThroughCallbackToAuthorizationCode)
{
    // 未登录访问 authorize，被送往登录入口
    HttpResponse to_login = server->process_request(get(config::AUTHORIZE_PATH, authorize_query("openid profile")));
    ASSERT_EQ(to_login.status, 302);

    HttpResponse to_upstream = server->process_request(follow(to_login));
    ASSERT_EQ(to_upstream.status, 302);
    std::string state = location_params(to_upstream)["state"];
    std::string state_cookie = set_cookie_value(to_upstream, config::SSO_STATE_COOKIE);
    ASSERT_FALSE(state_cookie.empty());

    // 上游带着 code 和原样的 state 回调
    HttpRequest callback =
        get(config::SSO_CALLBACK_PATH, utils::build_query({{"code", "upstream-code-7"}, {"state", state}}));
    callback.headers["cookie"] = config::SSO_STATE_COOKIE + "=" + state_cookie;
    HttpResponse logged_in = server->process_request(callback);
    ASSERT_EQ(logged_in.status, 302) << logged_in.body;
    EXPECT_EQ(logged_in.header("Location"), config::AUTHORIZE_PATH + "?" + authorize_query("openid profile"));
    EXPECT_EQ(exchanged_codes, std::vector<std::string>{"upstream-code-7"});
    EXPECT_EQ(logged_in.header("Cache-Control"), "no-store");

    std::string session = set_cookie_value(logged_in, "hub_session");
    ASSERT_NE(session, "<unset>");
    std::string session_header = set_cookie_header(logged_in, "hub_session");
    EXPECT_NE(session_header.find("HttpOnly"), std::string::npos);
    EXPECT_NE(session_header.find("SameSite=Lax"), std::string::npos);
    EXPECT_NE(session_header.find("Secure"), std::string::npos);
    EXPECT_NE(session_header.find("Max-Age=" + std::to_string(config::DEFAULT_SESSION_TTL)), std::string::npos);
    EXPECT_EQ(set_cookie_value(logged_in, config::SSO_STATE_COOKIE), "");

    auto carol = store->find_user_by_external_id("adfs-carol");
    ASSERT_TRUE(carol.has_value());
    EXPECT_EQ(carol->email, "carol@example.com");
    EXPECT_EQ(carol->group_names, (std::vector<std::string>{"staff", "finance"}));
    grant(*store, DirectPrincipal{carol->id}, wiki.client);

    // 带着新会话回到 authorize，拿到授权码
    HttpRequest authorize = follow(logged_in);
    authorize.headers["cookie"] = "hub_session=" + session;
    HttpResponse issued = server->process_request(authorize);
    ASSERT_EQ(issued.status, 302);
    EXPECT_TRUE(utils::starts_with(issued.header("Location"), REDIRECT_URI + "?"));
    std::string code = location_params(issued)["code"];
    ASSERT_FALSE(code.empty());

    nlohmann::json tokens = exchange(code);
    HttpRequest userinfo = get(config::USERINFO_PATH);
    userinfo.headers["authorization"] = "Bearer " + tokens["access_token"].get<std::string>();
    HttpResponse info = server->process_request(userinfo);
    ASSERT_EQ(info.status, 200);
    auto claims = nlohmann::json::parse(info.body);
    EXPECT_EQ(claims["sub"], carol->id);
    EXPECT_EQ(claims["email"], "carol@example.com");
    EXPECT_EQ(claims["department"], "Finance");
}

TEST_F(OAuthServerTest, SsoCallbackRequiresMatchingStateCookie)
{
    std::string query = utils::build_query({{"code", "upstream-code"}, {"state", "nonce-1|/"}});

    HttpResponse no_cookie = server->process_request(get(config::SSO_CALLBACK_PATH, query));
    EXPECT_EQ(no_cookie.status, 400);

    HttpRequest wrong = get(config::SSO_CALLBACK_PATH, query);
    wrong.headers["cookie"] = config::SSO_STATE_COOKIE + "=nonce-2";
    EXPECT_EQ(server->process_request(wrong).status, 400);

    HttpRequest no_code = get(config::SSO_CALLBACK_PATH, "state=nonce-1%7C%2F");
    no_code.headers["cookie"] = config::SSO_STATE_COOKIE + "=nonce-1";
    EXPECT_EQ(server->process_request(no_code).status, 400);

    HttpResponse denied = server->process_request(get(config::SSO_CALLBACK_PATH, "error=access_denied&state=x"));
    EXPECT_EQ(denied.status, 400);

    EXPECT_TRUE(exchanged_codes.empty());
    EXPECT_FALSE(store->find_user_by_external_id("adfs-carol").has_value());
}

TEST_F(OAuthServerTest, SsoCallbackOnlyRedirectsToLocalPaths)
{
    for (const std::string target : {"https://evil.example.com/", "//evil.example.com/x", "/\\evil.example.com",
                                     "/ok\r\nSet-Cookie: x=1", "javascript:alert(1)", ""})
    {
        HttpResponse response = sso_callback(target);
        ASSERT_EQ(response.status, 302) << target;
        EXPECT_EQ(response.header("Location"), "/") << target;
    }

    EXPECT_EQ(sso_callback("/dashboard?tab=apps").header("Location"), "/dashboard?tab=apps");
    EXPECT_EQ(OAuthServer::safe_redirect_target("/oauth/authorize?a=1&b=2"), "/oauth/authorize?a=1&b=2");
}

TEST_F(OAuthServerTest, SsoCallbackWithIncompleteClaimsMapsTo502)
{
    upstream_claims = {{"sub", "adfs-carol"}};
    HttpResponse response = sso_callback("/");
    EXPECT_EQ(response.status, 502);
    EXPECT_EQ(set_cookie_value(response, "hub_session"), "<unset>");
    EXPECT_FALSE(store->find_user_by_external_id("adfs-carol").has_value());
}

TEST_F(OAuthServerTest, SsoCallbackRefusesDeactivatedUser)
{
    add_user(*store, "dave", false);
    upstream_claims = {{"sub", "ext-dave"}, {"email", "dave@example.com"}};

    HttpResponse response = sso_callback("/");
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(set_cookie_value(response, "hub_session"), "<unset>");
}

TEST_F(OAuthServerTest, LogoutClearsSessionCookie)
{
    HttpRequest request;
    request.method = "POST";
    request.path = config::LOGOUT_PATH;
    request.headers["cookie"] = session_cookie;

    HttpResponse response = server->process_request(request);
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(set_cookie_value(response, "hub_session"), "");
    EXPECT_NE(set_cookie_header(response, "hub_session").find("Max-Age=0"), std::string::npos);

    EXPECT_EQ(server->process_request(get(config::LOGOUT_PATH)).status, 405);
}

TEST_F(OAuthServerTest, UpstreamFailureMapsTo502)
{
    upstream_down = true;
    HttpResponse response = server->process_request(get(config::SSO_LOGIN_PATH));
    EXPECT_EQ(response.status, 502);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error"], "temporarily_unavailable");
}

TEST_F(OAuthServerTest, HealthAndRoutingErrors)
{
    HttpResponse health = server->process_request(get(config::HEALTH_PATH));
    ASSERT_EQ(health.status, 200);
    EXPECT_EQ(nlohmann::json::parse(health.body)["status"], "ok");

    EXPECT_EQ(server->process_request(get("/nope")).status, 404);

    HttpResponse wrong_method = server->process_request(get(config::TOKEN_PATH));
    EXPECT_EQ(wrong_method.status, 405);
    EXPECT_EQ(wrong_method.header("Allow"), "POST");
}

TEST(HttpMessageTest, ParsesRequestLineHeadersAndBody)
{
    std::string raw = "POST /oauth/token?debug=1 HTTP/1.1\r\n"
                      "Host: hub.example.com\r\n"
                      "Content-Type: application/x-www-form-urlencoded\r\n"
                      "Cookie: a=1; hub_session=abc.def\r\n"
                      "\r\n"
                      "grant_type=refresh_token&refresh_token=r%2B1";
    HttpRequest request;
    ASSERT_TRUE(HttpRequest::parse(raw, request));
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.path, "/oauth/token");
    EXPECT_EQ(request.query_params()["debug"], "1");
    EXPECT_EQ(request.header("Content-Type"), "application/x-www-form-urlencoded");
    EXPECT_EQ(request.cookie("hub_session"), "abc.def");
    EXPECT_EQ(request.form_params()["refresh_token"], "r+1");

    HttpRequest broken;
    EXPECT_FALSE(HttpRequest::parse("GARBAGE\r\n\r\n", broken));
    EXPECT_FALSE(HttpRequest::parse("GET / HTTP/1.1\r\n", broken));
}

TEST(HttpMessageTest, SerializesResponse)
{
    HttpResponse response = HttpResponse::json(401, {{"error", "invalid_client"}});
    std::string wire = response.serialize();
    EXPECT_TRUE(utils::starts_with(wire, "HTTP/1.1 401 Unauthorized\r\n"));
    EXPECT_NE(wire.find("Content-Length: " + std::to_string(response.body.size()) + "\r\n"), std::string::npos);
    EXPECT_TRUE(utils::ends_with(wire, "\r\n\r\n" + response.body));
}
