#include "MemoryOAuthStore.hpp"
#include <algorithm>

std::map<std::string, Client>::iterator MemoryOAuthStore::client_by_client_id_locked(const std::string &client_id)
{
    return std::find_if(clients_.begin(), clients_.end(),
                        [&client_id](const std::pair<const std::string, Client> &entry)
                        { return entry.second.client_id == client_id; });
}

bool MemoryOAuthStore::insert_client(const Client &client)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (clients_.count(client.id) || client_by_client_id_locked(client.client_id) != clients_.end())
        return false;
    clients_.emplace(client.id, client);
    return true;
}

std::optional<Client> MemoryOAuthStore::find_client(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(id);
    if (it == clients_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Client> MemoryOAuthStore::find_client_by_client_id(const std::string &client_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = client_by_client_id_locked(client_id);
    if (it == clients_.end())
        return std::nullopt;
    return it->second;
}

std::vector<Client> MemoryOAuthStore::list_clients()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Client> out;
    for (const auto &entry : clients_)
        out.push_back(entry.second);
    return out;
}

bool MemoryOAuthStore::update_client_secret(const std::string &client_id, const std::string &secret_hash)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = client_by_client_id_locked(client_id);
    if (it == clients_.end())
        return false;
    it->second.client_secret_hash = secret_hash;
    return true;
}

bool MemoryOAuthStore::set_client_active(const std::string &client_id, bool active)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = client_by_client_id_locked(client_id);
    if (it == clients_.end())
        return false;
    it->second.active = active;
    return true;
}

bool MemoryOAuthStore::set_client_public(const std::string &client_id, bool is_public)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = client_by_client_id_locked(client_id);
    if (it == clients_.end())
        return false;
    it->second.is_public = is_public;
    return true;
}

bool MemoryOAuthStore::insert_user(const UserRecord &user)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.count(user.id))
        return false;
    for (const auto &entry : users_)
    {
        if (entry.second.external_subject_id == user.external_subject_id)
            return false;
    }
    users_.emplace(user.id, user);
    return true;
}

bool MemoryOAuthStore::update_user(const UserRecord &user)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user.id);
    if (it == users_.end())
        return false;
    it->second = user;
    return true;
}

std::optional<UserRecord> MemoryOAuthStore::find_user(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end())
        return std::nullopt;
    return it->second;
}

std::optional<UserRecord> MemoryOAuthStore::find_user_by_external_id(const std::string &external_subject_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : users_)
    {
        if (entry.second.external_subject_id == external_subject_id)
            return entry.second;
    }
    return std::nullopt;
}

bool MemoryOAuthStore::insert_group(const Group &group)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.count(group.id))
        return false;
    for (const auto &entry : groups_)
    {
        if (entry.second.name == group.name)
            return false;
    }
    groups_.emplace(group.id, group);
    return true;
}

std::optional<Group> MemoryOAuthStore::find_group(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Group> MemoryOAuthStore::find_group_by_name(const std::string &name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : groups_)
    {
        if (entry.second.name == name)
            return entry.second;
    }
    return std::nullopt;
}

std::vector<Group> MemoryOAuthStore::list_groups()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Group> out;
    for (const auto &entry : groups_)
        out.push_back(entry.second);
    return out;
}

bool MemoryOAuthStore::delete_group(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.erase(id) == 0)
        return false;

    const Principal principal = GroupPrincipal{id};
    grants_.erase(std::remove_if(grants_.begin(), grants_.end(),
                                 [&principal](const AccessGrant &grant)
                                 { return grant.principal == principal; }),
                  grants_.end());
    return true;
}

bool MemoryOAuthStore::add_group_member(const std::string &group_id, const std::string &subject_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group_id);
    if (it == groups_.end())
        return false;
    return it->second.members.insert(subject_id).second;
}

bool MemoryOAuthStore::remove_group_member(const std::string &group_id, const std::string &subject_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group_id);
    if (it == groups_.end())
        return false;
    return it->second.members.erase(subject_id) > 0;
}

std::vector<std::string> MemoryOAuthStore::groups_of_subject(const std::string &subject_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto &entry : groups_)
    {
        if (entry.second.members.count(subject_id))
            out.push_back(entry.first);
    }
    return out;
}

bool MemoryOAuthStore::insert_grant(const AccessGrant &grant)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &existing : grants_)
    {
        if (existing.client_pk == grant.client_pk && existing.principal == grant.principal)
            return false;
    }
    grants_.push_back(grant);
    return true;
}

bool MemoryOAuthStore::delete_grant(const Principal &principal, const std::string &client_pk)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(grants_.begin(), grants_.end(),
                           [&](const AccessGrant &grant)
                           { return grant.client_pk == client_pk && grant.principal == principal; });
    if (it == grants_.end())
        return false;
    grants_.erase(it);
    return true;
}

std::vector<AccessGrant> MemoryOAuthStore::grants_for_client(const std::string &client_pk)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AccessGrant> out;
    for (const auto &grant : grants_)
    {
        if (grant.client_pk == client_pk)
            out.push_back(grant);
    }
    return out;
}

std::vector<AccessGrant> MemoryOAuthStore::list_grants()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_;
}

bool MemoryOAuthStore::insert_code(const AuthorizationCode &code)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return codes_.emplace(code.code_hash, code).second;
}

std::optional<AuthorizationCode> MemoryOAuthStore::find_code(const std::string &code_hash)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(code_hash);
    if (it == codes_.end())
        return std::nullopt;
    return it->second;
}

bool MemoryOAuthStore::consume_code(const std::string &code_hash, long now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(code_hash);
    if (it == codes_.end() || it->second.consumed_at)
        return false;
    it->second.consumed_at = now;
    return true;
}

bool MemoryOAuthStore::token_pair_insertable_locked(const TokenPair &pair) const
{
    if (token_pairs_.count(pair.id))
        return false;
    for (const auto &entry : token_pairs_)
    {
        if (entry.second.access_jti == pair.access_jti ||
            entry.second.refresh_token_hash == pair.refresh_token_hash)
            return false;
    }
    return true;
}

bool MemoryOAuthStore::insert_token_pair(const TokenPair &pair)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!token_pair_insertable_locked(pair))
        return false;
    token_pairs_.emplace(pair.id, pair);
    return true;
}

std::optional<TokenPair> MemoryOAuthStore::find_token_pair(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = token_pairs_.find(id);
    if (it == token_pairs_.end())
        return std::nullopt;
    return it->second;
}

std::optional<TokenPair> MemoryOAuthStore::find_token_pair_by_refresh_hash(const std::string &refresh_hash)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : token_pairs_)
    {
        if (entry.second.refresh_token_hash == refresh_hash)
            return entry.second;
    }
    return std::nullopt;
}

std::optional<TokenPair> MemoryOAuthStore::find_token_pair_by_access_jti(const std::string &jti)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : token_pairs_)
    {
        if (entry.second.access_jti == jti)
            return entry.second;
    }
    return std::nullopt;
}

std::vector<TokenPair> MemoryOAuthStore::find_token_pairs_by_parent(const std::string &parent_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TokenPair> out;
    for (const auto &entry : token_pairs_)
    {
        if (!parent_id.empty() && entry.second.parent_id == parent_id)
            out.push_back(entry.second);
    }
    return out;
}

bool MemoryOAuthStore::rotate_token_pair(const std::string &old_id, long now, const TokenPair &replacement)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = token_pairs_.find(old_id);
    if (it == token_pairs_.end() || it->second.revoked_at)
        return false;
    if (!token_pair_insertable_locked(replacement))
        return false;

    it->second.revoked_at = now;
    token_pairs_.emplace(replacement.id, replacement);
    return true;
}

bool MemoryOAuthStore::revoke_token_pair(const std::string &id, long now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = token_pairs_.find(id);
    if (it == token_pairs_.end() || it->second.revoked_at)
        return false;
    it->second.revoked_at = now;
    return true;
}

PurgeStats MemoryOAuthStore::purge_expired(long now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    PurgeStats stats;
    for (auto it = codes_.begin(); it != codes_.end();)
    {
        if (it->second.expires_at < now)
        {
            it = codes_.erase(it);
            ++stats.deleted_codes;
        }
        else
        {
            ++it;
        }
    }
    for (auto it = token_pairs_.begin(); it != token_pairs_.end();)
    {
        if (it->second.refresh_expires_at < now && it->second.expires_at < now)
        {
            it = token_pairs_.erase(it);
            ++stats.deleted_tokens;
        }
        else
        {
            ++it;
        }
    }
    return stats;
}
