#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include "OAuthStore.hpp"

// "谁可以访问某应用"的查询结果
struct AccessSummary
{
    bool is_public = false;
    std::set<std::string> direct_subjects;
    std::set<std::string> groups;
    // 直接授权与组成员展开后的全部用户；is_public 为 true 时不穷举
    std::set<std::string> subjects;
};

// 访问决策：
//   allowed(s, app) = app.is_public
//                   || 存在 Direct(s) -> app
//                   || 存在 Group(g) -> app 且 s 属于 g
// 纯函数部分无副作用；store 版本只读
class AccessEvaluator
{
public:
    static bool evaluate(const std::string &subject_id, const Client &client,
                         const std::vector<std::string> &subject_group_ids,
                         const std::vector<AccessGrant> &grants);

    static AccessSummary summarize(const Client &client, const std::vector<AccessGrant> &grants,
                                   const std::vector<Group> &groups);

    explicit AccessEvaluator(std::shared_ptr<OAuthStore> store);

    bool can_access(const std::string &subject_id, const Client &client) const;

    AccessSummary who_can_access(const Client &client) const;

    // 该用户可访问的激活客户端
    std::vector<Client> accessible_clients(const std::string &subject_id) const;

private:
    std::shared_ptr<OAuthStore> store_;
};
