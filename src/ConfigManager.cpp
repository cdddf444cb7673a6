#include "ConfigManager.hpp"
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

ServerConfig::ServerConfig()
    : host(config::DEFAULT_HOST), port(config::DEFAULT_PORT),
      worker_threads(config::DEFAULT_WORKER_THREADS), issuer("http://localhost:8000")
{
}

OAuthConfig::OAuthConfig()
    : code_ttl(config::DEFAULT_CODE_TTL), access_token_ttl(config::DEFAULT_ACCESS_TOKEN_TTL),
      refresh_token_ttl(config::DEFAULT_REFRESH_TOKEN_TTL), session_cookie("hub_session"),
      session_ttl(config::DEFAULT_SESSION_TTL), login_path(config::SSO_LOGIN_PATH)
{
}

UpstreamConfig::UpstreamConfig()
    : scopes("openid profile email"), cache_ttl(config::DEFAULT_DISCOVERY_CACHE_TTL), request_timeout(10)
{
}

ConfigManager::ConfigManager(const std::string &config_file)
    : config_file_path_(config_file)
{
}

bool ConfigManager::load_config()
{
    try
    {
        std::ifstream file(config_file_path_);
        if (!file.is_open())
        {
            std::cout << "配置文件不存在，将创建默认配置文件: " << config_file_path_ << std::endl;
            bool saved = save_config();
            apply_environment();
            return saved;
        }

        nlohmann::json config;
        file >> config;
        file.close();

        parse_config(config);
        apply_environment();
        return true;
    }
    catch (const std::exception &e)
    {
        std::cerr << "加载配置文件失败: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::save_config()
{
    try
    {
        nlohmann::json config = get_default_config();

        config["database"]["backend"] = db_config_.backend;
        config["database"]["host"] = db_config_.host;
        config["database"]["port"] = db_config_.port;
        config["database"]["user"] = db_config_.user;
        config["database"]["password"] = db_config_.password;
        config["database"]["name"] = db_config_.database;
        config["database"]["charset"] = db_config_.charset;
        config["database"]["connection_timeout"] = db_config_.connection_timeout;
        config["database"]["read_timeout"] = db_config_.read_timeout;
        config["database"]["write_timeout"] = db_config_.write_timeout;

        // 连接池配置
        config["database"]["pool"]["initial_size"] = db_config_.pool_config.initial_size;
        config["database"]["pool"]["max_size"] = db_config_.pool_config.max_size;
        config["database"]["pool"]["max_idle_time"] = db_config_.pool_config.max_idle_time;
        config["database"]["pool"]["wait_timeout"] = db_config_.pool_config.wait_timeout;
        config["database"]["pool"]["auto_reconnect"] = db_config_.pool_config.auto_reconnect;

        config["server"]["host"] = server_config_.host;
        config["server"]["port"] = server_config_.port;
        config["server"]["worker_threads"] = server_config_.worker_threads;
        config["server"]["issuer"] = server_config_.issuer;

        // 签名密钥不写回文件，由运维单独下发
        config["oauth"]["code_ttl"] = oauth_config_.code_ttl;
        config["oauth"]["access_token_ttl"] = oauth_config_.access_token_ttl;
        config["oauth"]["refresh_token_ttl"] = oauth_config_.refresh_token_ttl;
        config["oauth"]["session_cookie"] = oauth_config_.session_cookie;
        config["oauth"]["session_ttl"] = oauth_config_.session_ttl;
        config["oauth"]["login_path"] = oauth_config_.login_path;

        config["upstream"]["discovery_url"] = upstream_config_.discovery_url;
        config["upstream"]["client_id"] = upstream_config_.client_id;
        config["upstream"]["redirect_uri"] = upstream_config_.redirect_uri;
        config["upstream"]["scopes"] = upstream_config_.scopes;
        config["upstream"]["cache_ttl"] = upstream_config_.cache_ttl;
        config["upstream"]["request_timeout"] = upstream_config_.request_timeout;

        // 确保目录存在
        std::filesystem::path config_path(config_file_path_);
        std::filesystem::path config_dir = config_path.parent_path();
        if (!config_dir.empty() && !std::filesystem::exists(config_dir))
        {
            std::filesystem::create_directories(config_dir);
        }

        std::ofstream file(config_file_path_);
        file << config.dump(4) << std::endl;
        file.close();

        return true;
    }
    catch (const std::exception &e)
    {
        std::cerr << "保存配置文件失败: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::validate(std::string &error) const
{
    if (oauth_config_.signing_secret.size() < config::MIN_SIGNING_SECRET_LENGTH)
    {
        error = "oauth.signing_secret 长度不足 " + std::to_string(config::MIN_SIGNING_SECRET_LENGTH) +
                " 字节（可通过 HUB_SIGNING_SECRET 设置）";
        return false;
    }
    if (oauth_config_.code_ttl <= 0 || oauth_config_.access_token_ttl <= 0 || oauth_config_.refresh_token_ttl <= 0 ||
        oauth_config_.session_ttl <= 0)
    {
        error = "oauth 有效期必须为正数";
        return false;
    }
    if (db_config_.backend != "mysql" && db_config_.backend != "memory")
    {
        error = "database.backend 只支持 mysql 或 memory";
        return false;
    }
    if (server_config_.worker_threads == 0)
    {
        error = "server.worker_threads 不能为 0";
        return false;
    }
    return true;
}

const DatabaseConfig &ConfigManager::get_database_config() const
{
    return db_config_;
}

const ServerConfig &ConfigManager::get_server_config() const
{
    return server_config_;
}

const OAuthConfig &ConfigManager::get_oauth_config() const
{
    return oauth_config_;
}

const UpstreamConfig &ConfigManager::get_upstream_config() const
{
    return upstream_config_;
}

void ConfigManager::set_database_config(const DatabaseConfig &config)
{
    db_config_ = config;
}

void ConfigManager::set_server_config(const ServerConfig &config)
{
    server_config_ = config;
}

void ConfigManager::set_oauth_config(const OAuthConfig &config)
{
    oauth_config_ = config;
}

void ConfigManager::set_upstream_config(const UpstreamConfig &config)
{
    upstream_config_ = config;
}

void ConfigManager::apply_environment()
{
    const char *secret = std::getenv("HUB_SIGNING_SECRET");
    if (secret && secret[0] != '\0')
        oauth_config_.signing_secret = secret;

    const char *db_password = std::getenv("HUB_DB_PASSWORD");
    if (db_password && db_password[0] != '\0')
        db_config_.password = db_password;

    const char *upstream_secret = std::getenv("HUB_UPSTREAM_CLIENT_SECRET");
    if (upstream_secret && upstream_secret[0] != '\0')
        upstream_config_.client_secret = upstream_secret;
}

void ConfigManager::parse_config(const nlohmann::json &config)
{
    // 解析数据库配置
    if (config.contains("database"))
    {
        const auto &db = config["database"];
        db_config_.backend = db.value("backend", db_config_.backend);
        db_config_.host = db.value("host", db_config_.host);
        db_config_.port = db.value("port", db_config_.port);
        db_config_.user = db.value("user", db_config_.user);
        db_config_.password = db.value("password", db_config_.password);
        db_config_.database = db.value("name", db_config_.database);
        db_config_.charset = db.value("charset", db_config_.charset);
        db_config_.connection_timeout = db.value("connection_timeout", db_config_.connection_timeout);
        db_config_.read_timeout = db.value("read_timeout", db_config_.read_timeout);
        db_config_.write_timeout = db.value("write_timeout", db_config_.write_timeout);

        // 解析连接池配置
        if (db.contains("pool"))
        {
            const auto &pool = db["pool"];
            auto &pc = db_config_.pool_config;
            pc.initial_size = pool.value("initial_size", pc.initial_size);
            pc.max_size = pool.value("max_size", pc.max_size);
            pc.max_idle_time = pool.value("max_idle_time", pc.max_idle_time);
            pc.wait_timeout = pool.value("wait_timeout", pc.wait_timeout);
            pc.auto_reconnect = pool.value("auto_reconnect", pc.auto_reconnect);
        }
    }

    if (config.contains("server"))
    {
        const auto &server = config["server"];
        server_config_.host = server.value("host", server_config_.host);
        server_config_.port = server.value("port", server_config_.port);
        server_config_.worker_threads = server.value("worker_threads", server_config_.worker_threads);
        server_config_.issuer = server.value("issuer", server_config_.issuer);
        while (!server_config_.issuer.empty() && server_config_.issuer.back() == '/')
            server_config_.issuer.pop_back();
    }

    if (config.contains("oauth"))
    {
        const auto &oauth = config["oauth"];
        oauth_config_.signing_secret = oauth.value("signing_secret", oauth_config_.signing_secret);
        oauth_config_.code_ttl = oauth.value("code_ttl", oauth_config_.code_ttl);
        oauth_config_.access_token_ttl = oauth.value("access_token_ttl", oauth_config_.access_token_ttl);
        oauth_config_.refresh_token_ttl = oauth.value("refresh_token_ttl", oauth_config_.refresh_token_ttl);
        oauth_config_.session_cookie = oauth.value("session_cookie", oauth_config_.session_cookie);
        oauth_config_.session_ttl = oauth.value("session_ttl", oauth_config_.session_ttl);
        oauth_config_.login_path = oauth.value("login_path", oauth_config_.login_path);
    }

    if (config.contains("upstream"))
    {
        const auto &upstream = config["upstream"];
        upstream_config_.discovery_url = upstream.value("discovery_url", upstream_config_.discovery_url);
        upstream_config_.client_id = upstream.value("client_id", upstream_config_.client_id);
        upstream_config_.client_secret = upstream.value("client_secret", upstream_config_.client_secret);
        upstream_config_.redirect_uri = upstream.value("redirect_uri", upstream_config_.redirect_uri);
        upstream_config_.scopes = upstream.value("scopes", upstream_config_.scopes);
        upstream_config_.cache_ttl = upstream.value("cache_ttl", upstream_config_.cache_ttl);
        upstream_config_.request_timeout = upstream.value("request_timeout", upstream_config_.request_timeout);
    }
}

nlohmann::json ConfigManager::get_default_config()
{
    nlohmann::json config;

    // 数据库默认配置
    config["database"]["backend"] = "mysql";
    config["database"]["host"] = "localhost";
    config["database"]["port"] = 3306;
    config["database"]["user"] = "hub";
    config["database"]["password"] = "";
    config["database"]["name"] = "hub_oauth";
    config["database"]["charset"] = "utf8mb4";
    config["database"]["connection_timeout"] = 60;
    config["database"]["read_timeout"] = 60;
    config["database"]["write_timeout"] = 60;

    // 连接池默认配置
    config["database"]["pool"]["initial_size"] = 5;
    config["database"]["pool"]["max_size"] = 20;
    config["database"]["pool"]["max_idle_time"] = 300;
    config["database"]["pool"]["wait_timeout"] = 5000;
    config["database"]["pool"]["auto_reconnect"] = true;

    config["server"]["host"] = config::DEFAULT_HOST;
    config["server"]["port"] = config::DEFAULT_PORT;
    config["server"]["worker_threads"] = config::DEFAULT_WORKER_THREADS;
    config["server"]["issuer"] = "http://localhost:8000";

    config["oauth"]["code_ttl"] = config::DEFAULT_CODE_TTL;
    config["oauth"]["access_token_ttl"] = config::DEFAULT_ACCESS_TOKEN_TTL;
    config["oauth"]["refresh_token_ttl"] = config::DEFAULT_REFRESH_TOKEN_TTL;
    config["oauth"]["session_cookie"] = "hub_session";
    config["oauth"]["session_ttl"] = config::DEFAULT_SESSION_TTL;
    config["oauth"]["login_path"] = config::SSO_LOGIN_PATH;

    config["upstream"]["discovery_url"] = "";
    config["upstream"]["client_id"] = "";
    config["upstream"]["redirect_uri"] = "http://localhost:8000/auth/sso/callback";
    config["upstream"]["scopes"] = "openid profile email";
    config["upstream"]["cache_ttl"] = config::DEFAULT_DISCOVERY_CACHE_TTL;
    config["upstream"]["request_timeout"] = 10;

    return config;
}
