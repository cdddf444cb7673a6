#pragma once

#include <string>
#include <vector>

namespace config
{
    // 协议常量
    extern const std::string RESPONSE_TYPE_CODE;
    extern const std::string GRANT_AUTHORIZATION_CODE;
    extern const std::string GRANT_REFRESH_TOKEN;
    extern const std::string TOKEN_TYPE_BEARER;
    extern const std::string DEFAULT_SCOPE;

    // 支持的 scope
    extern const std::vector<std::string> SUPPORTED_SCOPES;

    // 默认有效期（秒）
    extern const long DEFAULT_CODE_TTL;
    extern const long DEFAULT_ACCESS_TOKEN_TTL;
    extern const long DEFAULT_REFRESH_TOKEN_TTL;
    extern const long DEFAULT_DISCOVERY_CACHE_TTL;
    extern const long DEFAULT_SESSION_TTL;
    extern const long SSO_STATE_TTL;

    // 签名密钥最小长度（字节）
    extern const size_t MIN_SIGNING_SECRET_LENGTH;

    // 路由
    extern const std::string DISCOVERY_PATH;
    extern const std::string AUTHORIZE_PATH;
    extern const std::string TOKEN_PATH;
    extern const std::string USERINFO_PATH;
    extern const std::string REVOKE_PATH;
    extern const std::string SSO_LOGIN_PATH;
    extern const std::string SSO_CALLBACK_PATH;
    extern const std::string LOGOUT_PATH;

    // 登录往返期间保存 state 随机数的 cookie
    extern const std::string SSO_STATE_COOKIE;
    extern const std::string HEALTH_PATH;

    // 服务器默认值
    extern const int DEFAULT_PORT;
    extern const std::string DEFAULT_HOST;
    extern const size_t DEFAULT_WORKER_THREADS;
    extern const size_t MAX_REQUEST_BYTES;
}
