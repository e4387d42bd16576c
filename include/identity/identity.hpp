#pragma once

#include "common/utils.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using EventTags = std::vector<std::vector<std::string>>;

// Signed, timestamped statement by an identity. id is the hex SHA-256 of the
// canonical serialization, sig is the signature over id.
struct SignedEvent {
    std::string pubkey;
    int64_t createdAt{0};
    int kind{0};
    EventTags tags;
    std::string content;
    std::string id;
    std::string sig;

    // Value of the first tag named |name|, if any
    std::optional<std::string> getTagValue(const std::string& name) const;

    // Hex SHA-256 over [0, pubkey, created_at, kind, tags, content]
    std::string computeId() const;
};

void to_json(nlohmann::json& j, const SignedEvent& event);
void from_json(const nlohmann::json& j, SignedEvent& event);

// Event kind used for all backup protocol events
constexpr int kBackupEventKind = 30078;

class Identity {
public:
    virtual ~Identity() = default;

    virtual bool isAvailable() const = 0;
    virtual std::string publicKey() const = 0;

    virtual std::optional<SignedEvent> sign(int kind, const EventTags& tags,
                                            const std::string& content,
                                            int64_t createdAt) const = 0;
    std::optional<SignedEvent> sign(int kind, const EventTags& tags,
                                    const std::string& content) const {
        return sign(kind, tags, content, utils::nowSeconds());
    }

    // Checks the id and the signature against event.pubkey
    virtual bool verify(const SignedEvent& event) const = 0;

    // Payload encryption to an arbitrary public identity; only the holder of
    // the matching private key can decrypt.
    virtual std::optional<Bytes> encryptFor(const std::string& recipientPublicKey,
                                            const Bytes& plaintext) const = 0;
    virtual std::optional<Bytes> decrypt(const Bytes& ciphertext) const = 0;

    // Symmetric encryption keyed from this identity's private key material
    virtual std::optional<Bytes> encryptManifest(const Bytes& plaintext) const = 0;
    virtual std::optional<Bytes> decryptManifest(const Bytes& ciphertext) const = 0;
};
