#pragma once

#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

// 当前 Unix 时间（秒）；测试中可替换
using Clock = std::function<long()>;

Clock system_clock();

// RFC 6749 错误码
enum class OAuthError
{
    None,
    InvalidRequest,
    InvalidClient,
    InvalidGrant,
    UnsupportedResponseType,
    UnsupportedGrantType,
    AccessDenied
};

const char *to_string(OAuthError error);

// 上游身份源不可达或断言格式错误
class UpstreamError : public std::runtime_error
{
public:
    explicit UpstreamError(const std::string &message) : std::runtime_error(message) {}
};

// 持久化层故障（连接、SQL 执行）
class StoreError : public std::runtime_error
{
public:
    explicit StoreError(const std::string &message) : std::runtime_error(message) {}
};

// 操作结果：error 为 None 时 value 有效
template <typename T>
struct OAuthResult
{
    OAuthError error = OAuthError::None;
    T value{};

    bool ok() const { return error == OAuthError::None; }

    static OAuthResult success(T v)
    {
        OAuthResult r;
        r.value = std::move(v);
        return r;
    }

    static OAuthResult failure(OAuthError e)
    {
        OAuthResult r;
        r.error = e;
        return r;
    }
};

// 已注册的客户端应用
struct Client
{
    std::string id; // 内部主键
    std::string client_id;
    std::string name;
    std::string client_secret_hash; // SHA-256 hex
    std::set<std::string> redirect_uris;
    bool active = true;
    bool is_public = false;
    long created_at = 0;
};

// 本地用户（由上游身份断言创建）
struct UserRecord
{
    std::string id;
    std::string external_subject_id;
    std::string email;
    std::string display_name;
    std::string department;
    std::string job_title;
    std::vector<std::string> group_names; // 上游目录组，仅用于 userinfo
    bool active = true;
    long created_at = 0;
    std::optional<long> last_login_at;
};

struct Group
{
    std::string id;
    std::string name;
    std::set<std::string> members; // 用户 id
    long created_at = 0;
};

struct DirectPrincipal
{
    std::string subject_id;
};

struct GroupPrincipal
{
    std::string group_id;
};

inline bool operator==(const DirectPrincipal &a, const DirectPrincipal &b) { return a.subject_id == b.subject_id; }
inline bool operator==(const GroupPrincipal &a, const GroupPrincipal &b) { return a.group_id == b.group_id; }

// 授权主体：用户或组，二者恰取其一
using Principal = std::variant<DirectPrincipal, GroupPrincipal>;

struct AccessGrant
{
    Principal principal;
    std::string client_pk;
    long granted_at = 0;
};

struct AuthorizationCode
{
    std::string code_hash; // 明文 code 只返回给调用方，不落库
    std::string subject;
    std::string client_pk;
    std::string redirect_uri;
    std::vector<std::string> scopes;
    std::string state;
    long issued_at = 0;
    long expires_at = 0;
    std::optional<long> consumed_at;
};

enum class CodeState
{
    Unknown,
    Pending,
    Consumed,
    Expired
};

struct TokenPair
{
    std::string id;
    std::string access_jti;
    std::string refresh_token_hash;
    std::string subject;
    std::string client_pk;
    std::vector<std::string> scopes;
    long issued_at = 0;
    long expires_at = 0;         // access token 过期时间
    long refresh_expires_at = 0; // refresh token 过期时间
    std::optional<long> revoked_at;
    std::string parent_id; // 轮换前的 pair，首发为空
};

// 返回给客户端的令牌
struct IssuedTokens
{
    std::string access_token;
    std::string token_type = "Bearer";
    long expires_in = 0;
    std::string refresh_token;
    std::vector<std::string> scopes;

    nlohmann::json to_json() const;
};

struct PurgeStats
{
    size_t deleted_codes = 0;
    size_t deleted_tokens = 0;
};
