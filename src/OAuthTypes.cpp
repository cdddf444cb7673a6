#include "OAuthTypes.hpp"
#include "utils.hpp"

Clock system_clock()
{
    return []()
    { return utils::get_current_timestamp(); };
}

const char *to_string(OAuthError error)
{
    switch (error)
    {
    case OAuthError::None:
        return "none";
    case OAuthError::InvalidRequest:
        return "invalid_request";
    case OAuthError::InvalidClient:
        return "invalid_client";
    case OAuthError::InvalidGrant:
        return "invalid_grant";
    case OAuthError::UnsupportedResponseType:
        return "unsupported_response_type";
    case OAuthError::UnsupportedGrantType:
        return "unsupported_grant_type";
    case OAuthError::AccessDenied:
        return "access_denied";
    }
    return "invalid_request";
}

nlohmann::json IssuedTokens::to_json() const
{
    return {
        {"access_token", access_token},
        {"token_type", token_type},
        {"expires_in", expires_in},
        {"refresh_token", refresh_token},
        {"scope", utils::join(scopes, " ")}};
}
