#pragma once

#include <optional>
#include <string>
#include <vector>
#include "OAuthTypes.hpp"

// 持久化接口：普通 CRUD 加上对 consumed_at / revoked_at 的原子条件更新。
// 实现在连接或执行失败时抛出 StoreError。
class OAuthStore
{
public:
    virtual ~OAuthStore() = default;

    // --- 客户端 ---
    // client_id 重复时返回 false
    virtual bool insert_client(const Client &client) = 0;
    virtual std::optional<Client> find_client(const std::string &id) = 0;
    virtual std::optional<Client> find_client_by_client_id(const std::string &client_id) = 0;
    virtual std::vector<Client> list_clients() = 0;
    virtual bool update_client_secret(const std::string &client_id, const std::string &secret_hash) = 0;
    virtual bool set_client_active(const std::string &client_id, bool active) = 0;
    virtual bool set_client_public(const std::string &client_id, bool is_public) = 0;

    // --- 用户 ---
    virtual bool insert_user(const UserRecord &user) = 0;
    virtual bool update_user(const UserRecord &user) = 0;
    virtual std::optional<UserRecord> find_user(const std::string &id) = 0;
    virtual std::optional<UserRecord> find_user_by_external_id(const std::string &external_subject_id) = 0;

    // --- 组 ---
    // 组名重复时返回 false
    virtual bool insert_group(const Group &group) = 0;
    virtual std::optional<Group> find_group(const std::string &id) = 0;
    virtual std::optional<Group> find_group_by_name(const std::string &name) = 0;
    virtual std::vector<Group> list_groups() = 0;
    // 级联删除成员关系和该组的全部授权
    virtual bool delete_group(const std::string &id) = 0;
    virtual bool add_group_member(const std::string &group_id, const std::string &subject_id) = 0;
    virtual bool remove_group_member(const std::string &group_id, const std::string &subject_id) = 0;
    virtual std::vector<std::string> groups_of_subject(const std::string &subject_id) = 0;

    // --- 授权 ---
    // (主体, 客户端) 已存在时返回 false
    virtual bool insert_grant(const AccessGrant &grant) = 0;
    virtual bool delete_grant(const Principal &principal, const std::string &client_pk) = 0;
    virtual std::vector<AccessGrant> grants_for_client(const std::string &client_pk) = 0;
    virtual std::vector<AccessGrant> list_grants() = 0;

    // --- 授权码 ---
    virtual bool insert_code(const AuthorizationCode &code) = 0;
    virtual std::optional<AuthorizationCode> find_code(const std::string &code_hash) = 0;
    // 仅当 consumed_at 为空时写入 now；并发调用中恰有一个返回 true
    virtual bool consume_code(const std::string &code_hash, long now) = 0;

    // --- 令牌 ---
    virtual bool insert_token_pair(const TokenPair &pair) = 0;
    virtual std::optional<TokenPair> find_token_pair(const std::string &id) = 0;
    virtual std::optional<TokenPair> find_token_pair_by_refresh_hash(const std::string &refresh_hash) = 0;
    virtual std::optional<TokenPair> find_token_pair_by_access_jti(const std::string &jti) = 0;
    virtual std::vector<TokenPair> find_token_pairs_by_parent(const std::string &parent_id) = 0;
    // 同一事务内：仅当旧 pair 未撤销时撤销之并插入 replacement
    virtual bool rotate_token_pair(const std::string &old_id, long now, const TokenPair &replacement) = 0;
    // 仅当尚未撤销时写入 revoked_at
    virtual bool revoke_token_pair(const std::string &id, long now) = 0;

    // 删除已过期的授权码和令牌
    virtual PurgeStats purge_expired(long now) = 0;
};
