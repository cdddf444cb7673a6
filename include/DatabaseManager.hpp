#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ConfigManager.hpp"
#include "DatabaseConnectionPool.hpp"
#include "OAuthStore.hpp"

// MySQL 存储。所有列表字段（redirect_uris、scopes、group_names）以 JSON 文本保存；
// 授权码消费和令牌撤销用带 IS NULL 条件的 UPDATE 实现原子性。
class DatabaseManager : public OAuthStore
{
public:
    explicit DatabaseManager(const DatabaseConfig &config);
    ~DatabaseManager() override;

    // 建立连接池并创建缺失的表
    bool initialize();

    void close();

    std::string get_pool_status() const;

    bool insert_client(const Client &client) override;
    std::optional<Client> find_client(const std::string &id) override;
    std::optional<Client> find_client_by_client_id(const std::string &client_id) override;
    std::vector<Client> list_clients() override;
    bool update_client_secret(const std::string &client_id, const std::string &secret_hash) override;
    bool set_client_active(const std::string &client_id, bool active) override;
    bool set_client_public(const std::string &client_id, bool is_public) override;

    bool insert_user(const UserRecord &user) override;
    bool update_user(const UserRecord &user) override;
    std::optional<UserRecord> find_user(const std::string &id) override;
    std::optional<UserRecord> find_user_by_external_id(const std::string &external_subject_id) override;

    bool insert_group(const Group &group) override;
    std::optional<Group> find_group(const std::string &id) override;
    std::optional<Group> find_group_by_name(const std::string &name) override;
    std::vector<Group> list_groups() override;
    bool delete_group(const std::string &id) override;
    bool add_group_member(const std::string &group_id, const std::string &subject_id) override;
    bool remove_group_member(const std::string &group_id, const std::string &subject_id) override;
    std::vector<std::string> groups_of_subject(const std::string &subject_id) override;

    bool insert_grant(const AccessGrant &grant) override;
    bool delete_grant(const Principal &principal, const std::string &client_pk) override;
    std::vector<AccessGrant> grants_for_client(const std::string &client_pk) override;
    std::vector<AccessGrant> list_grants() override;

    bool insert_code(const AuthorizationCode &code) override;
    std::optional<AuthorizationCode> find_code(const std::string &code_hash) override;
    bool consume_code(const std::string &code_hash, long now) override;

    bool insert_token_pair(const TokenPair &pair) override;
    std::optional<TokenPair> find_token_pair(const std::string &id) override;
    std::optional<TokenPair> find_token_pair_by_refresh_hash(const std::string &refresh_hash) override;
    std::optional<TokenPair> find_token_pair_by_access_jti(const std::string &jti) override;
    std::vector<TokenPair> find_token_pairs_by_parent(const std::string &parent_id) override;
    bool rotate_token_pair(const std::string &old_id, long now, const TokenPair &replacement) override;
    bool revoke_token_pair(const std::string &id, long now) override;

    PurgeStats purge_expired(long now) override;

private:
    PooledConnection connection();

    bool initialize_tables();

    std::vector<Client> select_clients(PooledConnection &conn, const std::string &where);
    std::vector<UserRecord> select_users(PooledConnection &conn, const std::string &where);
    std::vector<Group> select_groups(PooledConnection &conn, const std::string &where);
    std::vector<AccessGrant> select_grants(PooledConnection &conn, const std::string &where);
    std::vector<TokenPair> select_token_pairs(PooledConnection &conn, const std::string &where);

    std::string token_pair_insert_sql(PooledConnection &conn, const TokenPair &pair);

    DatabaseConfig config_;
    std::unique_ptr<DatabaseConnectionPool> connection_pool_;
};
