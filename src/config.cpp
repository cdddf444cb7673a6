#include "config.hpp"

namespace config
{
    const std::string RESPONSE_TYPE_CODE = "code";
    const std::string GRANT_AUTHORIZATION_CODE = "authorization_code";
    const std::string GRANT_REFRESH_TOKEN = "refresh_token";
    const std::string TOKEN_TYPE_BEARER = "Bearer";
    const std::string DEFAULT_SCOPE = "openid";

    const std::vector<std::string> SUPPORTED_SCOPES = {"openid", "profile", "email"};

    const long DEFAULT_CODE_TTL = 600;
    const long DEFAULT_ACCESS_TOKEN_TTL = 3600;
    const long DEFAULT_REFRESH_TOKEN_TTL = 30L * 24 * 3600;
    const long DEFAULT_DISCOVERY_CACHE_TTL = 3600;
    const long DEFAULT_SESSION_TTL = 3600;
    const long SSO_STATE_TTL = 600;

    const size_t MIN_SIGNING_SECRET_LENGTH = 32;

    const std::string DISCOVERY_PATH = "/.well-known/openid-configuration";
    const std::string AUTHORIZE_PATH = "/oauth/authorize";
    const std::string TOKEN_PATH = "/oauth/token";
    const std::string USERINFO_PATH = "/oauth/userinfo";
    const std::string REVOKE_PATH = "/oauth/revoke";
    const std::string SSO_LOGIN_PATH = "/auth/sso/login";
    const std::string SSO_CALLBACK_PATH = "/auth/sso/callback";
    const std::string LOGOUT_PATH = "/auth/logout";

    const std::string SSO_STATE_COOKIE = "hub_sso_state";
    const std::string HEALTH_PATH = "/health";

    const int DEFAULT_PORT = 8000;
    const std::string DEFAULT_HOST = "0.0.0.0";
    const size_t DEFAULT_WORKER_THREADS = 8;
    const size_t MAX_REQUEST_BYTES = 64 * 1024;
}
