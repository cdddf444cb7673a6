#include "DatabaseManager.hpp"
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <nlohmann/json.hpp>

namespace
{
    std::string text(MYSQL_ROW row, int index)
    {
        return row[index] ? row[index] : "";
    }

    long number(MYSQL_ROW row, int index)
    {
        return row[index] ? std::atol(row[index]) : 0;
    }

    std::optional<long> nullable_number(MYSQL_ROW row, int index)
    {
        if (!row[index])
            return std::nullopt;
        return std::atol(row[index]);
    }

    template <typename Container>
    std::string to_json_text(const Container &values)
    {
        nlohmann::json array = nlohmann::json::array();
        for (const auto &value : values)
            array.push_back(value);
        return array.dump();
    }

    std::vector<std::string> json_text_list(const std::string &value)
    {
        std::vector<std::string> out;
        nlohmann::json parsed = nlohmann::json::parse(value, nullptr, false);
        if (!parsed.is_array())
            return out;
        for (const auto &item : parsed)
        {
            if (item.is_string())
                out.push_back(item.get<std::string>());
        }
        return out;
    }

    std::string nullable(const std::optional<long> &value)
    {
        return value ? std::to_string(*value) : "NULL";
    }

    const char *principal_type(const Principal &principal)
    {
        return std::holds_alternative<DirectPrincipal>(principal) ? "user" : "group";
    }

    const std::string &principal_id(const Principal &principal)
    {
        if (const auto *direct = std::get_if<DirectPrincipal>(&principal))
            return direct->subject_id;
        return std::get<GroupPrincipal>(principal).group_id;
    }

    const char *const CLIENT_COLUMNS =
        "SELECT id, client_id, name, client_secret_hash, redirect_uris, active, is_public, created_at FROM clients";
    const char *const USER_COLUMNS =
        "SELECT id, external_subject_id, email, display_name, department, job_title, group_names, active, "
        "created_at, last_login_at FROM users";
    const char *const TOKEN_PAIR_COLUMNS =
        "SELECT id, access_jti, refresh_token_hash, subject, client_pk, scopes, issued_at, expires_at, "
        "refresh_expires_at, revoked_at, parent_id FROM oauth_token_pairs";
}

DatabaseManager::DatabaseManager(const DatabaseConfig &config) : config_(config)
{
}

DatabaseManager::~DatabaseManager()
{
    close();
}

bool DatabaseManager::initialize()
{
    connection_pool_ = std::make_unique<DatabaseConnectionPool>(config_, config_.pool_config);

    if (!connection_pool_->initialize())
    {
        std::cerr << "数据库连接池初始化失败" << std::endl;
        connection_pool_.reset();
        return false;
    }

    try
    {
        if (!initialize_tables())
        {
            std::cerr << "数据库表初始化失败" << std::endl;
            return false;
        }
    }
    catch (const StoreError &e)
    {
        std::cerr << "数据库表初始化失败: " << e.what() << std::endl;
        return false;
    }

    std::cout << "✅ MySQL 存储已就绪: " << config_.host << ":" << config_.port << "/" << config_.database << std::endl;
    return true;
}

void DatabaseManager::close()
{
    if (connection_pool_)
    {
        connection_pool_->shutdown();
        connection_pool_.reset();
    }
}

std::string DatabaseManager::get_pool_status() const
{
    if (!connection_pool_)
        return "连接池未初始化";
    return connection_pool_->get_status();
}

PooledConnection DatabaseManager::connection()
{
    if (!connection_pool_ || !connection_pool_->is_valid())
        throw StoreError("数据库连接池未初始化");
    return connection_pool_->acquire();
}

bool DatabaseManager::initialize_tables()
{
    const char *statements[] = {
        R"(
        CREATE TABLE IF NOT EXISTS clients (
            id VARCHAR(64) PRIMARY KEY,
            client_id VARCHAR(128) NOT NULL UNIQUE,
            name VARCHAR(255) NOT NULL,
            client_secret_hash CHAR(64) NOT NULL,
            redirect_uris TEXT NOT NULL,
            active TINYINT(1) NOT NULL DEFAULT 1,
            is_public TINYINT(1) NOT NULL DEFAULT 0,
            created_at BIGINT NOT NULL
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )",
        R"(
        CREATE TABLE IF NOT EXISTS users (
            id VARCHAR(64) PRIMARY KEY,
            external_subject_id VARCHAR(255) NOT NULL UNIQUE,
            email VARCHAR(255) NOT NULL,
            display_name VARCHAR(255) NOT NULL,
            department VARCHAR(255) NOT NULL DEFAULT '',
            job_title VARCHAR(255) NOT NULL DEFAULT '',
            group_names TEXT NOT NULL,
            active TINYINT(1) NOT NULL DEFAULT 1,
            created_at BIGINT NOT NULL,
            last_login_at BIGINT DEFAULT NULL,
            INDEX idx_email (email)
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )",
        R"(
        CREATE TABLE IF NOT EXISTS user_groups (
            id VARCHAR(64) PRIMARY KEY,
            name VARCHAR(255) NOT NULL UNIQUE,
            created_at BIGINT NOT NULL
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )",
        R"(
        CREATE TABLE IF NOT EXISTS user_group_members (
            group_id VARCHAR(64) NOT NULL,
            subject_id VARCHAR(64) NOT NULL,
            PRIMARY KEY (group_id, subject_id),
            INDEX idx_subject_id (subject_id)
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )",
        R"(
        CREATE TABLE IF NOT EXISTS access_grants (
            principal_type ENUM('user', 'group') NOT NULL,
            principal_id VARCHAR(64) NOT NULL,
            client_pk VARCHAR(64) NOT NULL,
            granted_at BIGINT NOT NULL,
            PRIMARY KEY (principal_type, principal_id, client_pk),
            INDEX idx_client_pk (client_pk)
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )",
        R"(
        CREATE TABLE IF NOT EXISTS oauth_codes (
            code_hash CHAR(64) PRIMARY KEY,
            subject VARCHAR(64) NOT NULL,
            client_pk VARCHAR(64) NOT NULL,
            redirect_uri TEXT NOT NULL,
            scopes TEXT NOT NULL,
            state TEXT NOT NULL,
            issued_at BIGINT NOT NULL,
            expires_at BIGINT NOT NULL,
            consumed_at BIGINT DEFAULT NULL,
            INDEX idx_expires_at (expires_at)
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )",
        R"(
        CREATE TABLE IF NOT EXISTS oauth_token_pairs (
            id VARCHAR(64) PRIMARY KEY,
            access_jti VARCHAR(64) NOT NULL UNIQUE,
            refresh_token_hash CHAR(64) NOT NULL UNIQUE,
            subject VARCHAR(64) NOT NULL,
            client_pk VARCHAR(64) NOT NULL,
            scopes TEXT NOT NULL,
            issued_at BIGINT NOT NULL,
            expires_at BIGINT NOT NULL,
            refresh_expires_at BIGINT NOT NULL,
            revoked_at BIGINT DEFAULT NULL,
            parent_id VARCHAR(64) DEFAULT NULL,
            INDEX idx_parent_id (parent_id),
            INDEX idx_refresh_expires_at (refresh_expires_at)
        ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci
        )"};

    PooledConnection conn = connection();
    for (const char *statement : statements)
        conn.execute(statement);
    return true;
}

// --- 客户端 ---

std::vector<Client> DatabaseManager::select_clients(PooledConnection &conn, const std::string &where)
{
    std::vector<Client> out;
    ResultSet result = conn.query(std::string(CLIENT_COLUMNS) + where);
    while (MYSQL_ROW row = result.next())
    {
        Client client;
        client.id = text(row, 0);
        client.client_id = text(row, 1);
        client.name = text(row, 2);
        client.client_secret_hash = text(row, 3);
        for (const auto &uri : json_text_list(text(row, 4)))
            client.redirect_uris.insert(uri);
        client.active = number(row, 5) != 0;
        client.is_public = number(row, 6) != 0;
        client.created_at = number(row, 7);
        out.push_back(std::move(client));
    }
    return out;
}

bool DatabaseManager::insert_client(const Client &client)
{
    PooledConnection conn = connection();
    std::stringstream q;
    q << "INSERT INTO clients (id, client_id, name, client_secret_hash, redirect_uris, active, is_public, created_at) VALUES ("
      << conn.quote(client.id) << ", "
      << conn.quote(client.client_id) << ", "
      << conn.quote(client.name) << ", "
      << conn.quote(client.client_secret_hash) << ", "
      << conn.quote(to_json_text(client.redirect_uris)) << ", "
      << (client.active ? 1 : 0) << ", "
      << (client.is_public ? 1 : 0) << ", "
      << client.created_at << ")";
    return conn.try_insert(q.str());
}

std::optional<Client> DatabaseManager::find_client(const std::string &id)
{
    PooledConnection conn = connection();
    auto rows = select_clients(conn, " WHERE id = " + conn.quote(id) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::optional<Client> DatabaseManager::find_client_by_client_id(const std::string &client_id)
{
    PooledConnection conn = connection();
    auto rows = select_clients(conn, " WHERE client_id = " + conn.quote(client_id) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::vector<Client> DatabaseManager::list_clients()
{
    PooledConnection conn = connection();
    return select_clients(conn, " ORDER BY created_at");
}

bool DatabaseManager::update_client_secret(const std::string &client_id, const std::string &secret_hash)
{
    PooledConnection conn = connection();
    return conn.execute("UPDATE clients SET client_secret_hash = " + conn.quote(secret_hash) +
                        " WHERE client_id = " + conn.quote(client_id)) > 0;
}

bool DatabaseManager::set_client_active(const std::string &client_id, bool active)
{
    PooledConnection conn = connection();
    return conn.execute("UPDATE clients SET active = " + std::to_string(active ? 1 : 0) +
                        " WHERE client_id = " + conn.quote(client_id)) > 0;
}

bool DatabaseManager::set_client_public(const std::string &client_id, bool is_public)
{
    PooledConnection conn = connection();
    return conn.execute("UPDATE clients SET is_public = " + std::to_string(is_public ? 1 : 0) +
                        " WHERE client_id = " + conn.quote(client_id)) > 0;
}

// --- 用户 ---

std::vector<UserRecord> DatabaseManager::select_users(PooledConnection &conn, const std::string &where)
{
    std::vector<UserRecord> out;
    ResultSet result = conn.query(std::string(USER_COLUMNS) + where);
    while (MYSQL_ROW row = result.next())
    {
        UserRecord user;
        user.id = text(row, 0);
        user.external_subject_id = text(row, 1);
        user.email = text(row, 2);
        user.display_name = text(row, 3);
        user.department = text(row, 4);
        user.job_title = text(row, 5);
        user.group_names = json_text_list(text(row, 6));
        user.active = number(row, 7) != 0;
        user.created_at = number(row, 8);
        user.last_login_at = nullable_number(row, 9);
        out.push_back(std::move(user));
    }
    return out;
}

bool DatabaseManager::insert_user(const UserRecord &user)
{
    PooledConnection conn = connection();
    std::stringstream q;
    q << "INSERT INTO users (id, external_subject_id, email, display_name, department, job_title, group_names, "
         "active, created_at, last_login_at) VALUES ("
      << conn.quote(user.id) << ", "
      << conn.quote(user.external_subject_id) << ", "
      << conn.quote(user.email) << ", "
      << conn.quote(user.display_name) << ", "
      << conn.quote(user.department) << ", "
      << conn.quote(user.job_title) << ", "
      << conn.quote(to_json_text(user.group_names)) << ", "
      << (user.active ? 1 : 0) << ", "
      << user.created_at << ", "
      << nullable(user.last_login_at) << ")";
    return conn.try_insert(q.str());
}

bool DatabaseManager::update_user(const UserRecord &user)
{
    PooledConnection conn = connection();
    std::stringstream q;
    q << "UPDATE users SET "
      << "email = " << conn.quote(user.email) << ", "
      << "display_name = " << conn.quote(user.display_name) << ", "
      << "department = " << conn.quote(user.department) << ", "
      << "job_title = " << conn.quote(user.job_title) << ", "
      << "group_names = " << conn.quote(to_json_text(user.group_names)) << ", "
      << "active = " << (user.active ? 1 : 0) << ", "
      << "last_login_at = " << nullable(user.last_login_at)
      << " WHERE id = " << conn.quote(user.id);
    return conn.execute(q.str()) > 0;
}

std::optional<UserRecord> DatabaseManager::find_user(const std::string &id)
{
    PooledConnection conn = connection();
    auto rows = select_users(conn, " WHERE id = " + conn.quote(id) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::optional<UserRecord> DatabaseManager::find_user_by_external_id(const std::string &external_subject_id)
{
    PooledConnection conn = connection();
    auto rows = select_users(conn, " WHERE external_subject_id = " + conn.quote(external_subject_id) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

// --- 组 ---

std::vector<Group> DatabaseManager::select_groups(PooledConnection &conn, const std::string &where)
{
    std::vector<Group> out;
    std::map<std::string, size_t> index;
    {
        ResultSet result = conn.query("SELECT id, name, created_at FROM user_groups" + where);
        while (MYSQL_ROW row = result.next())
        {
            Group group;
            group.id = text(row, 0);
            group.name = text(row, 1);
            group.created_at = number(row, 2);
            index[group.id] = out.size();
            out.push_back(std::move(group));
        }
    }
    if (out.empty())
        return out;

    std::string ids;
    for (const auto &group : out)
    {
        if (!ids.empty())
            ids += ", ";
        ids += conn.quote(group.id);
    }

    ResultSet members = conn.query("SELECT group_id, subject_id FROM user_group_members WHERE group_id IN (" + ids + ")");
    while (MYSQL_ROW row = members.next())
    {
        auto it = index.find(text(row, 0));
        if (it != index.end())
            out[it->second].members.insert(text(row, 1));
    }
    return out;
}

bool DatabaseManager::insert_group(const Group &group)
{
    PooledConnection conn = connection();
    Transaction tx(conn);
    std::stringstream q;
    q << "INSERT INTO user_groups (id, name, created_at) VALUES ("
      << conn.quote(group.id) << ", " << conn.quote(group.name) << ", " << group.created_at << ")";
    if (!conn.try_insert(q.str()))
        return false;

    for (const auto &member : group.members)
    {
        conn.execute("INSERT INTO user_group_members (group_id, subject_id) VALUES (" +
                     conn.quote(group.id) + ", " + conn.quote(member) + ")");
    }
    tx.commit();
    return true;
}

std::optional<Group> DatabaseManager::find_group(const std::string &id)
{
    PooledConnection conn = connection();
    auto rows = select_groups(conn, " WHERE id = " + conn.quote(id) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::optional<Group> DatabaseManager::find_group_by_name(const std::string &name)
{
    PooledConnection conn = connection();
    auto rows = select_groups(conn, " WHERE name = " + conn.quote(name) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::vector<Group> DatabaseManager::list_groups()
{
    PooledConnection conn = connection();
    return select_groups(conn, " ORDER BY name");
}

bool DatabaseManager::delete_group(const std::string &id)
{
    PooledConnection conn = connection();
    Transaction tx(conn);
    std::string quoted = conn.quote(id);
    if (conn.execute("DELETE FROM user_groups WHERE id = " + quoted) == 0)
        return false;

    conn.execute("DELETE FROM user_group_members WHERE group_id = " + quoted);
    conn.execute("DELETE FROM access_grants WHERE principal_type = 'group' AND principal_id = " + quoted);
    tx.commit();
    return true;
}

bool DatabaseManager::add_group_member(const std::string &group_id, const std::string &subject_id)
{
    PooledConnection conn = connection();
    ResultSet exists = conn.query("SELECT 1 FROM user_groups WHERE id = " + conn.quote(group_id) + " LIMIT 1");
    if (!exists.next())
        return false;

    return conn.try_insert("INSERT INTO user_group_members (group_id, subject_id) VALUES (" +
                           conn.quote(group_id) + ", " + conn.quote(subject_id) + ")");
}

bool DatabaseManager::remove_group_member(const std::string &group_id, const std::string &subject_id)
{
    PooledConnection conn = connection();
    return conn.execute("DELETE FROM user_group_members WHERE group_id = " + conn.quote(group_id) +
                        " AND subject_id = " + conn.quote(subject_id)) > 0;
}

std::vector<std::string> DatabaseManager::groups_of_subject(const std::string &subject_id)
{
    PooledConnection conn = connection();
    std::vector<std::string> out;
    ResultSet result = conn.query("SELECT group_id FROM user_group_members WHERE subject_id = " + conn.quote(subject_id));
    while (MYSQL_ROW row = result.next())
        out.push_back(text(row, 0));
    return out;
}

// --- 授权 ---

std::vector<AccessGrant> DatabaseManager::select_grants(PooledConnection &conn, const std::string &where)
{
    std::vector<AccessGrant> out;
    ResultSet result = conn.query("SELECT principal_type, principal_id, client_pk, granted_at FROM access_grants" + where);
    while (MYSQL_ROW row = result.next())
    {
        AccessGrant grant;
        if (text(row, 0) == "group")
            grant.principal = GroupPrincipal{text(row, 1)};
        else
            grant.principal = DirectPrincipal{text(row, 1)};
        grant.client_pk = text(row, 2);
        grant.granted_at = number(row, 3);
        out.push_back(std::move(grant));
    }
    return out;
}

bool DatabaseManager::insert_grant(const AccessGrant &grant)
{
    PooledConnection conn = connection();
    std::stringstream q;
    q << "INSERT INTO access_grants (principal_type, principal_id, client_pk, granted_at) VALUES ('"
      << principal_type(grant.principal) << "', "
      << conn.quote(principal_id(grant.principal)) << ", "
      << conn.quote(grant.client_pk) << ", "
      << grant.granted_at << ")";
    return conn.try_insert(q.str());
}

bool DatabaseManager::delete_grant(const Principal &principal, const std::string &client_pk)
{
    PooledConnection conn = connection();
    std::stringstream q;
    q << "DELETE FROM access_grants WHERE principal_type = '" << principal_type(principal) << "'"
      << " AND principal_id = " << conn.quote(principal_id(principal))
      << " AND client_pk = " << conn.quote(client_pk);
    return conn.execute(q.str()) > 0;
}

std::vector<AccessGrant> DatabaseManager::grants_for_client(const std::string &client_pk)
{
    PooledConnection conn = connection();
    return select_grants(conn, " WHERE client_pk = " + conn.quote(client_pk));
}

std::vector<AccessGrant> DatabaseManager::list_grants()
{
    PooledConnection conn = connection();
    return select_grants(conn, " ORDER BY granted_at");
}

// --- 授权码 ---

bool DatabaseManager::insert_code(const AuthorizationCode &code)
{
    PooledConnection conn = connection();
    std::stringstream q;
    q << "INSERT INTO oauth_codes (code_hash, subject, client_pk, redirect_uri, scopes, state, issued_at, expires_at, consumed_at) VALUES ("
      << conn.quote(code.code_hash) << ", "
      << conn.quote(code.subject) << ", "
      << conn.quote(code.client_pk) << ", "
      << conn.quote(code.redirect_uri) << ", "
      << conn.quote(to_json_text(code.scopes)) << ", "
      << conn.quote(code.state) << ", "
      << code.issued_at << ", "
      << code.expires_at << ", "
      << nullable(code.consumed_at) << ")";
    return conn.try_insert(q.str());
}

std::optional<AuthorizationCode> DatabaseManager::find_code(const std::string &code_hash)
{
    PooledConnection conn = connection();
    ResultSet result = conn.query(
        "SELECT code_hash, subject, client_pk, redirect_uri, scopes, state, issued_at, expires_at, consumed_at "
        "FROM oauth_codes WHERE code_hash = " + conn.quote(code_hash) + " LIMIT 1");
    MYSQL_ROW row = result.next();
    if (!row)
        return std::nullopt;

    AuthorizationCode code;
    code.code_hash = text(row, 0);
    code.subject = text(row, 1);
    code.client_pk = text(row, 2);
    code.redirect_uri = text(row, 3);
    code.scopes = json_text_list(text(row, 4));
    code.state = text(row, 5);
    code.issued_at = number(row, 6);
    code.expires_at = number(row, 7);
    code.consumed_at = nullable_number(row, 8);
    return code;
}

bool DatabaseManager::consume_code(const std::string &code_hash, long now)
{
    PooledConnection conn = connection();
    return conn.execute("UPDATE oauth_codes SET consumed_at = " + std::to_string(now) +
                        " WHERE code_hash = " + conn.quote(code_hash) + " AND consumed_at IS NULL") == 1;
}

// --- 令牌 ---

std::vector<TokenPair> DatabaseManager::select_token_pairs(PooledConnection &conn, const std::string &where)
{
    std::vector<TokenPair> out;
    ResultSet result = conn.query(std::string(TOKEN_PAIR_COLUMNS) + where);
    while (MYSQL_ROW row = result.next())
    {
        TokenPair pair;
        pair.id = text(row, 0);
        pair.access_jti = text(row, 1);
        pair.refresh_token_hash = text(row, 2);
        pair.subject = text(row, 3);
        pair.client_pk = text(row, 4);
        pair.scopes = json_text_list(text(row, 5));
        pair.issued_at = number(row, 6);
        pair.expires_at = number(row, 7);
        pair.refresh_expires_at = number(row, 8);
        pair.revoked_at = nullable_number(row, 9);
        pair.parent_id = text(row, 10);
        out.push_back(std::move(pair));
    }
    return out;
}

std::string DatabaseManager::token_pair_insert_sql(PooledConnection &conn, const TokenPair &pair)
{
    std::stringstream q;
    q << "INSERT INTO oauth_token_pairs (id, access_jti, refresh_token_hash, subject, client_pk, scopes, issued_at, "
         "expires_at, refresh_expires_at, revoked_at, parent_id) VALUES ("
      << conn.quote(pair.id) << ", "
      << conn.quote(pair.access_jti) << ", "
      << conn.quote(pair.refresh_token_hash) << ", "
      << conn.quote(pair.subject) << ", "
      << conn.quote(pair.client_pk) << ", "
      << conn.quote(to_json_text(pair.scopes)) << ", "
      << pair.issued_at << ", "
      << pair.expires_at << ", "
      << pair.refresh_expires_at << ", "
      << nullable(pair.revoked_at) << ", "
      << (pair.parent_id.empty() ? std::string("NULL") : conn.quote(pair.parent_id)) << ")";
    return q.str();
}

bool DatabaseManager::insert_token_pair(const TokenPair &pair)
{
    PooledConnection conn = connection();
    return conn.try_insert(token_pair_insert_sql(conn, pair));
}

std::optional<TokenPair> DatabaseManager::find_token_pair(const std::string &id)
{
    PooledConnection conn = connection();
    auto rows = select_token_pairs(conn, " WHERE id = " + conn.quote(id) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::optional<TokenPair> DatabaseManager::find_token_pair_by_refresh_hash(const std::string &refresh_hash)
{
    PooledConnection conn = connection();
    auto rows = select_token_pairs(conn, " WHERE refresh_token_hash = " + conn.quote(refresh_hash) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::optional<TokenPair> DatabaseManager::find_token_pair_by_access_jti(const std::string &jti)
{
    PooledConnection conn = connection();
    auto rows = select_token_pairs(conn, " WHERE access_jti = " + conn.quote(jti) + " LIMIT 1");
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::vector<TokenPair> DatabaseManager::find_token_pairs_by_parent(const std::string &parent_id)
{
    if (parent_id.empty())
        return {};
    PooledConnection conn = connection();
    return select_token_pairs(conn, " WHERE parent_id = " + conn.quote(parent_id));
}

bool DatabaseManager::rotate_token_pair(const std::string &old_id, long now, const TokenPair &replacement)
{
    PooledConnection conn = connection();
    Transaction tx(conn);

    // 条件更新决定谁赢得这次轮换；未提交的事务由 Transaction 析构回滚
    unsigned long long revoked = conn.execute("UPDATE oauth_token_pairs SET revoked_at = " + std::to_string(now) +
                                              " WHERE id = " + conn.quote(old_id) + " AND revoked_at IS NULL");
    if (revoked != 1)
        return false;

    if (!conn.try_insert(token_pair_insert_sql(conn, replacement)))
        return false;

    tx.commit();
    return true;
}

bool DatabaseManager::revoke_token_pair(const std::string &id, long now)
{
    PooledConnection conn = connection();
    return conn.execute("UPDATE oauth_token_pairs SET revoked_at = " + std::to_string(now) +
                        " WHERE id = " + conn.quote(id) + " AND revoked_at IS NULL") == 1;
}

PurgeStats DatabaseManager::purge_expired(long now)
{
    PooledConnection conn = connection();
    PurgeStats stats;
    std::string cutoff = std::to_string(now);
    stats.deleted_codes = static_cast<size_t>(conn.execute("DELETE FROM oauth_codes WHERE expires_at < " + cutoff));
    stats.deleted_tokens = static_cast<size_t>(conn.execute(
        "DELETE FROM oauth_token_pairs WHERE refresh_expires_at < " + cutoff + " AND expires_at < " + cutoff));
    return stats;
}
