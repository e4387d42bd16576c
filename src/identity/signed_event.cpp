#include "identity/identity.hpp"

std::optional<std::string> SignedEvent::getTagValue(const std::string& name) const {
    for (const auto& tag : tags) {
        if (tag.size() >= 2 && tag[0] == name) {
            return tag[1];
        }
    }
    return std::nullopt;
}

std::string SignedEvent::computeId() const {
    nlohmann::json canonical = nlohmann::json::array({0, pubkey, createdAt, kind, tags, content});
    std::string serialized = canonical.dump();
    return utils::sha256Hex(Bytes(serialized.begin(), serialized.end()));
}

void to_json(nlohmann::json& j, const SignedEvent& event) {
    j = nlohmann::json{
        {"id", event.id},
        {"pubkey", event.pubkey},
        {"created_at", event.createdAt},
        {"kind", event.kind},
        {"tags", event.tags},
        {"content", event.content},
        {"sig", event.sig}
    };
}

void from_json(const nlohmann::json& j, SignedEvent& event) {
    event.id = j.at("id").get<std::string>();
    event.pubkey = j.at("pubkey").get<std::string>();
    event.createdAt = j.at("created_at").get<int64_t>();
    event.kind = j.at("kind").get<int>();
    event.tags = j.value("tags", EventTags{});
    event.content = j.value("content", "");
    event.sig = j.at("sig").get<std::string>();
}
