// SessionDescription.cpp — offer/answer encoding

#include "balance/Network/SessionDescription.h"
#include "balance/Crypto.h"
#include "balance/Errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace Balance {

using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(DescriptionType type, const std::string& detail) {
    throw TransportError(TransportErrorCode::MalformedDescription,
                         std::string("Malformed ") + descriptionTypeToString(type) + ": " + detail);
}

std::string requireString(const json& j, const char* field, DescriptionType type) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        malformed(type, std::string("missing \"") + field + "\"");
    }
    return it->get<std::string>();
}

} // anonymous namespace

const char* descriptionTypeToString(DescriptionType type) {
    switch (type) {
        case DescriptionType::Offer:  return "offer";
        case DescriptionType::Answer: return "answer";
        default:                      return "offer";
    }
}

std::string SessionDescription::encode() const {
    json j = {
        {"v", version},
        {"type", descriptionTypeToString(type)},
        {"sessionId", sessionId},
        {"deviceId", deviceId},
        {"expiresAt", expiresAt}
    };
    if (psk) {
        j["psk"] = Crypto::toHex(std::vector<uint8_t>(psk->begin(), psk->end()));
    }
    if (!candidates.empty()) {
        json arr = json::array();
        for (const auto& c : candidates) {
            arr.push_back({{"host", c.host}, {"port", c.port}, {"type", c.type}});
        }
        j["candidates"] = std::move(arr);
    }
    return Crypto::base64Encode(j.dump());
}

SessionDescription SessionDescription::decode(const std::string& encoded,
                                              DescriptionType expected,
                                              int64_t nowMs) {
    std::string trimmed = encoded;
    trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  trimmed.end());
    if (trimmed.empty()) {
        malformed(expected, "empty description");
    }

    auto text = Crypto::base64Decode(trimmed);
    if (!text) {
        malformed(expected, "not valid base64");
    }

    json j = json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        malformed(expected, "not a JSON object");
    }

    auto v = j.find("v");
    if (v == j.end() || !v->is_number_integer() || v->get<int>() != SESSION_DESCRIPTION_VERSION) {
        malformed(expected, "unsupported version");
    }

    SessionDescription desc;
    const std::string typeName = requireString(j, "type", expected);
    if (typeName != descriptionTypeToString(expected)) {
        malformed(expected, "expected " + std::string(descriptionTypeToString(expected)) +
                            ", got \"" + typeName + "\"");
    }
    desc.type = expected;
    desc.sessionId = requireString(j, "sessionId", expected);
    desc.deviceId = requireString(j, "deviceId", expected);

    auto expiresAt = j.find("expiresAt");
    if (expiresAt == j.end() || !expiresAt->is_number_integer()) {
        malformed(expected, "missing \"expiresAt\"");
    }
    desc.expiresAt = expiresAt->get<int64_t>();

    if (expected == DescriptionType::Offer) {
        auto pskHex = j.find("psk");
        if (pskHex == j.end() || !pskHex->is_string()) {
            malformed(expected, "missing session key");
        }
        auto bytes = Crypto::fromHex(pskHex->get<std::string>());
        if (!bytes || bytes->size() != TLS_PSK_SIZE) {
            malformed(expected, "invalid session key");
        }
        PskKey key{};
        std::copy(bytes->begin(), bytes->end(), key.begin());
        desc.psk = key;
    }

    auto candidates = j.find("candidates");
    if (candidates != j.end()) {
        if (!candidates->is_array()) {
            malformed(expected, "candidates must be an array");
        }
        for (const auto& c : *candidates) {
            if (!c.is_object() || !c.contains("host") || !c["host"].is_string() ||
                !c.contains("port") || !c["port"].is_number_unsigned() ||
                c["port"].get<uint32_t>() == 0 || c["port"].get<uint32_t>() > 65535) {
                malformed(expected, "invalid candidate");
            }
            Candidate candidate;
            candidate.host = c["host"].get<std::string>();
            candidate.port = static_cast<uint16_t>(c["port"].get<uint32_t>());
            if (c.contains("type") && c["type"].is_string()) {
                candidate.type = c["type"].get<std::string>();
            }
            desc.candidates.push_back(std::move(candidate));
        }
    }
    if (expected == DescriptionType::Answer && desc.candidates.empty()) {
        malformed(expected, "no candidates");
    }

    if (desc.expiresAt < nowMs) {
        throw TransportError(TransportErrorCode::Expired,
                             std::string("The ") + descriptionTypeToString(expected) +
                             " has expired. Start a new sync session.");
    }

    return desc;
}

} // namespace Balance
