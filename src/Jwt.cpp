#include "Jwt.hpp"
#include "Crypto.hpp"

namespace jwt
{

    std::string GenerateToken(const nlohmann::json &claims, const std::string &secret)
    {
        nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};

        std::string header_enc = crypto::base64_url_encode(header.dump());
        std::string payload_enc = crypto::base64_url_encode(claims.dump());
        std::string signing_input = header_enc + "." + payload_enc;

        std::string sig_enc = crypto::base64_url_encode(crypto::hmac_sha256(secret, signing_input));
        return signing_input + "." + sig_enc;
    }

    bool VerifyToken(const std::string &token, const std::string &secret, long now, nlohmann::json &out_claims)
    {
        size_t p1 = token.find('.');
        if (p1 == std::string::npos)
            return false;
        size_t p2 = token.find('.', p1 + 1);
        if (p2 == std::string::npos || token.find('.', p2 + 1) != std::string::npos)
            return false;

        std::string header_enc = token.substr(0, p1);
        std::string payload_enc = token.substr(p1 + 1, p2 - p1 - 1);
        std::string signature_enc = token.substr(p2 + 1);
        std::string signing_input = header_enc + "." + payload_enc;

        std::string expected_sig_enc = crypto::base64_url_encode(crypto::hmac_sha256(secret, signing_input));
        if (!crypto::constant_time_equals(expected_sig_enc, signature_enc))
            return false;

        nlohmann::json header = nlohmann::json::parse(crypto::base64_url_decode(header_enc), nullptr, false);
        if (header.is_discarded() || !header.is_object() || header.value("alg", "") != "HS256")
            return false;

        nlohmann::json payload = nlohmann::json::parse(crypto::base64_url_decode(payload_enc), nullptr, false);
        if (payload.is_discarded() || !payload.is_object())
            return false;

        // exp 为必需字段
        if (!payload.contains("exp") || !payload["exp"].is_number_integer())
            return false;
        if (now >= payload["exp"].get<long>())
            return false;

        if (payload.contains("nbf") && payload["nbf"].is_number_integer() && now < payload["nbf"].get<long>())
            return false;

        out_claims = std::move(payload);
        return true;
    }

} // namespace jwt
