#pragma once

#include <string>
#include <nlohmann/json.hpp>

// 连接池配置结构
struct PoolConfig
{
    size_t initial_size = 5;
    size_t max_size = 20;
    size_t max_idle_time = 300;
    size_t wait_timeout = 5000;
    bool auto_reconnect = true;
};

// 数据库配置结构
struct DatabaseConfig
{
    std::string backend = "mysql"; // "mysql" 或 "memory"
    std::string host = "localhost";
    std::string user = "hub";
    std::string password;
    std::string database = "hub_oauth";
    unsigned int port = 3306;
    std::string charset = "utf8mb4";
    int connection_timeout = 60;
    int read_timeout = 60;
    int write_timeout = 60;
    PoolConfig pool_config;
};

// HTTP 服务配置
struct ServerConfig
{
    std::string host;
    int port;
    size_t worker_threads;
    std::string issuer; // 对外地址，用于 discovery 文档和 iss 声明

    ServerConfig();
};

// 协议参数
struct OAuthConfig
{
    std::string signing_secret;
    long code_ttl;
    long access_token_ttl;
    long refresh_token_ttl;
    std::string session_cookie;
    long session_ttl;
    std::string login_path;

    OAuthConfig();
};

// 上游身份源（ADFS / OIDC）
struct UpstreamConfig
{
    std::string discovery_url;
    std::string client_id;
    std::string client_secret; // 不写回配置文件
    std::string redirect_uri;
    std::string scopes;
    long cache_ttl;
    long request_timeout;

    UpstreamConfig();
};

class ConfigManager
{
private:
    std::string config_file_path_;
    DatabaseConfig db_config_;
    ServerConfig server_config_;
    OAuthConfig oauth_config_;
    UpstreamConfig upstream_config_;

    // 解析JSON配置
    void parse_config(const nlohmann::json &config);

    // 环境变量覆盖
    void apply_environment();

    // 生成默认配置
    nlohmann::json get_default_config();

public:
    explicit ConfigManager(const std::string &config_file = "./config/hub_config.json");

    virtual ~ConfigManager() = default;

    // 加载配置；文件不存在时写出默认配置
    bool load_config();

    // 保存配置
    bool save_config();

    // 检查启动所需的配置项，错误写入 error
    bool validate(std::string &error) const;

    const DatabaseConfig &get_database_config() const;
    const ServerConfig &get_server_config() const;
    const OAuthConfig &get_oauth_config() const;
    const UpstreamConfig &get_upstream_config() const;

    void set_database_config(const DatabaseConfig &config);
    void set_server_config(const ServerConfig &config);
    void set_oauth_config(const OAuthConfig &config);
    void set_upstream_config(const UpstreamConfig &config);
};
