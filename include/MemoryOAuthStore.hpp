#pragma once

#include <map>
#include <mutex>
#include <set>
#include "OAuthStore.hpp"

// 进程内存储：单把互斥锁保护全部表，用于测试和开发模式
class MemoryOAuthStore : public OAuthStore
{
public:
    MemoryOAuthStore() = default;
    ~MemoryOAuthStore() override = default;

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
    // 调用方须已持有 mutex_
    std::map<std::string, Client>::iterator client_by_client_id_locked(const std::string &client_id);
    bool token_pair_insertable_locked(const TokenPair &pair) const;

    mutable std::mutex mutex_;
    std::map<std::string, Client> clients_; // 以内部主键索引
    std::map<std::string, UserRecord> users_;
    std::map<std::string, Group> groups_;
    std::vector<AccessGrant> grants_;
    std::map<std::string, AuthorizationCode> codes_; // 以 code_hash 索引
    std::map<std::string, TokenPair> token_pairs_;   // 以 pair id 索引
};
