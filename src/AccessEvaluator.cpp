#include "AccessEvaluator.hpp"
#include <algorithm>

bool AccessEvaluator::evaluate(const std::string &subject_id, const Client &client,
                               const std::vector<std::string> &subject_group_ids,
                               const std::vector<AccessGrant> &grants)
{
    if (client.is_public)
        return true;
    if (subject_id.empty())
        return false;

    for (const auto &grant : grants)
    {
        if (grant.client_pk != client.id)
            continue;

        if (const auto *direct = std::get_if<DirectPrincipal>(&grant.principal))
        {
            if (direct->subject_id == subject_id)
                return true;
        }
        else
        {
            const auto &group_id = std::get<GroupPrincipal>(grant.principal).group_id;
            if (std::find(subject_group_ids.begin(), subject_group_ids.end(), group_id) != subject_group_ids.end())
                return true;
        }
    }
    return false;
}

AccessSummary AccessEvaluator::summarize(const Client &client, const std::vector<AccessGrant> &grants,
                                         const std::vector<Group> &groups)
{
    AccessSummary summary;
    summary.is_public = client.is_public;

    for (const auto &grant : grants)
    {
        if (grant.client_pk != client.id)
            continue;

        if (const auto *direct = std::get_if<DirectPrincipal>(&grant.principal))
        {
            summary.direct_subjects.insert(direct->subject_id);
            summary.subjects.insert(direct->subject_id);
            continue;
        }

        const auto &group_id = std::get<GroupPrincipal>(grant.principal).group_id;
        summary.groups.insert(group_id);
        auto group = std::find_if(groups.begin(), groups.end(),
                                  [&group_id](const Group &g)
                                  { return g.id == group_id; });
        if (group != groups.end())
            summary.subjects.insert(group->members.begin(), group->members.end());
    }
    return summary;
}

AccessEvaluator::AccessEvaluator(std::shared_ptr<OAuthStore> store)
    : store_(std::move(store))
{
}

bool AccessEvaluator::can_access(const std::string &subject_id, const Client &client) const
{
    if (client.is_public)
        return true;
    return evaluate(subject_id, client, store_->groups_of_subject(subject_id), store_->grants_for_client(client.id));
}

AccessSummary AccessEvaluator::who_can_access(const Client &client) const
{
    return summarize(client, store_->grants_for_client(client.id), store_->list_groups());
}

std::vector<Client> AccessEvaluator::accessible_clients(const std::string &subject_id) const
{
    auto group_ids = store_->groups_of_subject(subject_id);
    auto grants = store_->list_grants();

    std::vector<Client> out;
    for (const auto &client : store_->list_clients())
    {
        if (client.active && evaluate(subject_id, client, group_ids, grants))
            out.push_back(client);
    }
    return out;
}
