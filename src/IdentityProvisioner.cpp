#include "IdentityProvisioner.hpp"
#include "Crypto.hpp"
#include <initializer_list>
#include <iostream>

namespace
{
    // 按顺序取第一个非空字符串声明
    std::string first_claim(const nlohmann::json &claims, std::initializer_list<const char *> names)
    {
        for (const char *name : names)
        {
            auto it = claims.find(name);
            if (it != claims.end() && it->is_string() && !it->get<std::string>().empty())
                return it->get<std::string>();
        }
        return "";
    }
}

IdentityAssertion IdentityAssertion::from_claims(const nlohmann::json &claims)
{
    if (!claims.is_object())
        throw UpstreamError("身份断言不是 JSON 对象");

    IdentityAssertion assertion;
    assertion.external_subject_id = first_claim(claims, {"external_subject_id", "sub", "oid", "upn"});
    assertion.email = first_claim(claims, {"email", "upn", "unique_name"});

    if (assertion.external_subject_id.empty())
        throw UpstreamError("身份断言缺少必需字段: external_subject_id");
    if (assertion.email.empty())
        throw UpstreamError("身份断言缺少必需字段: email");

    assertion.display_name = first_claim(claims, {"display_name", "name", "given_name"});
    assertion.department = first_claim(claims, {"department"});
    assertion.job_title = first_claim(claims, {"job_title", "jobTitle", "title"});

    for (const char *key : {"group_names", "groups"})
    {
        auto it = claims.find(key);
        if (it == claims.end())
            continue;
        // ADFS 只有一个组时可能给出单个字符串
        if (it->is_string())
        {
            assertion.group_names.push_back(it->get<std::string>());
        }
        else if (it->is_array())
        {
            for (const auto &item : *it)
            {
                if (item.is_string())
                    assertion.group_names.push_back(item.get<std::string>());
            }
        }
        else
        {
            throw UpstreamError(std::string("身份断言字段格式错误: ") + key);
        }
        break;
    }
    return assertion;
}

IdentityProvisioner::IdentityProvisioner(std::shared_ptr<OAuthStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock))
{
}

UserRecord IdentityProvisioner::provision(const IdentityAssertion &assertion)
{
    long now = clock_();

    auto existing = store_->find_user_by_external_id(assertion.external_subject_id);
    if (existing)
    {
        UserRecord user = *existing;
        user.email = assertion.email;
        if (!assertion.display_name.empty())
            user.display_name = assertion.display_name;
        if (!assertion.department.empty())
            user.department = assertion.department;
        if (!assertion.job_title.empty())
            user.job_title = assertion.job_title;
        user.group_names = assertion.group_names;
        user.last_login_at = now;

        if (!store_->update_user(user))
            throw StoreError("更新用户失败: " + user.id);
        return user;
    }

    UserRecord user;
    user.id = crypto::random_hex();
    user.external_subject_id = assertion.external_subject_id;
    user.email = assertion.email;
    user.display_name = assertion.display_name;
    user.department = assertion.department;
    user.job_title = assertion.job_title;
    user.group_names = assertion.group_names;
    user.active = true;
    user.created_at = now;
    user.last_login_at = now;

    if (!store_->insert_user(user))
    {
        // 并发首次登录时另一请求已创建
        auto raced = store_->find_user_by_external_id(assertion.external_subject_id);
        if (raced)
            return *raced;
        throw StoreError("创建用户失败: " + assertion.external_subject_id);
    }

    std::cout << "已创建本地用户: " << user.id << std::endl;
    return user;
}
