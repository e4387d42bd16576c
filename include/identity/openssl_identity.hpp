#pragma once

#include "identity/identity.hpp"
#include <string>

// Identity backed by an Ed25519 signing key and an X25519 agreement key.
// The public identity is hex(ed25519_pub || x25519_pub).
//
// encryptFor output:  ephemeral_pub(32) || nonce(12) || ciphertext || tag(16)
// manifest output:    nonce(12) || ciphertext || tag(16)
class OpenSslIdentity : public Identity {
public:
    OpenSslIdentity() = default;

    static OpenSslIdentity generate();
    static std::optional<OpenSslIdentity> load(const std::string& path);
    bool save(const std::string& path) const;

    bool isAvailable() const override { return available_; }
    std::string publicKey() const override;

    using Identity::sign;
    std::optional<SignedEvent> sign(int kind, const EventTags& tags,
                                    const std::string& content,
                                    int64_t createdAt) const override;
    bool verify(const SignedEvent& event) const override;

    std::optional<Bytes> encryptFor(const std::string& recipientPublicKey,
                                    const Bytes& plaintext) const override;
    std::optional<Bytes> decrypt(const Bytes& ciphertext) const override;

    std::optional<Bytes> encryptManifest(const Bytes& plaintext) const override;
    std::optional<Bytes> decryptManifest(const Bytes& ciphertext) const override;

private:
    bool setKeys(const Bytes& signingPrivate, const Bytes& agreementPrivate);
    Bytes manifestKey() const;

    bool available_{false};
    Bytes signingPrivate_;
    Bytes signingPublic_;
    Bytes agreementPrivate_;
    Bytes agreementPublic_;
};
