#include "identity/openssl_identity.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

using json = nlohmann::json;

namespace {

constexpr size_t kKeySize = 32;
constexpr size_t kNonceSize = 12;
constexpr size_t kTagSize = 16;
const char* kFileKeyInfo = "peervault-backup-file";
const char* kManifestKeyContext = "peervault-backup-manifest";

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
struct CipherCtxDeleter { void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

PkeyPtr generateKey(int type) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(type, nullptr));
    EVP_PKEY* key = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 || EVP_PKEY_keygen(ctx.get(), &key) != 1) {
        throw std::runtime_error("Key generation failed");
    }
    return PkeyPtr(key);
}

Bytes rawPrivate(EVP_PKEY* key) {
    Bytes out(kKeySize);
    size_t len = out.size();
    if (EVP_PKEY_get_raw_private_key(key, out.data(), &len) != 1 || len != kKeySize) {
        throw std::runtime_error("Failed to export private key");
    }
    return out;
}

Bytes rawPublic(EVP_PKEY* key) {
    Bytes out(kKeySize);
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 || len != kKeySize) {
        throw std::runtime_error("Failed to export public key");
    }
    return out;
}

PkeyPtr privateKey(int type, const Bytes& raw) {
    return PkeyPtr(EVP_PKEY_new_raw_private_key(type, nullptr, raw.data(), raw.size()));
}

PkeyPtr publicKeyFromRaw(int type, const Bytes& raw) {
    return PkeyPtr(EVP_PKEY_new_raw_public_key(type, nullptr, raw.data(), raw.size()));
}

// Splits hex(ed25519_pub || x25519_pub) into its halves
bool splitPublicKey(const std::string& hex, Bytes& signing, Bytes& agreement) {
    auto raw = utils::fromHex(hex);
    if (!raw || raw->size() != 2 * kKeySize) {
        return false;
    }
    signing.assign(raw->begin(), raw->begin() + kKeySize);
    agreement.assign(raw->begin() + kKeySize, raw->end());
    return true;
}

std::optional<Bytes> deriveShared(EVP_PKEY* own, EVP_PKEY* peer) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own, nullptr));
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer) != 1) {
        return std::nullopt;
    }
    size_t len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &len) != 1) {
        return std::nullopt;
    }
    Bytes secret(len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &len) != 1) {
        return std::nullopt;
    }
    secret.resize(len);
    return secret;
}

std::optional<Bytes> hkdfSha256(const Bytes& secret, const Bytes& salt, const std::string& info) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    Bytes out(kKeySize);
    size_t len = out.size();
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) != 1 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), secret.data(), static_cast<int>(secret.size())) != 1 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) != 1 ||
        EVP_PKEY_derive(ctx.get(), out.data(), &len) != 1) {
        return std::nullopt;
    }
    return out;
}

// nonce || ciphertext || tag
std::optional<Bytes> aesGcmSeal(const Bytes& key, const Bytes& plaintext) {
    Bytes nonce = utils::randomBytes(kNonceSize);
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::nullopt;
    }

    Bytes out(nonce);
    out.resize(kNonceSize + plaintext.size() + kTagSize);
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data() + kNonceSize, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return std::nullopt;
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kNonceSize + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            out.data() + kNonceSize + total) != 1) {
        return std::nullopt;
    }
    out.resize(kNonceSize + total + kTagSize);
    return out;
}

std::optional<Bytes> aesGcmOpen(const Bytes& key, const uint8_t* data, size_t size) {
    if (size < kNonceSize + kTagSize) {
        return std::nullopt;
    }
    const uint8_t* nonce = data;
    const uint8_t* ciphertext = data + kNonceSize;
    size_t ciphertextSize = size - kNonceSize - kTagSize;
    Bytes tag(data + size - kTagSize, data + size);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return std::nullopt;
    }

    Bytes out(ciphertextSize + kTagSize);
    int len = 0;
    int total = 0;
    if (ciphertextSize > 0) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext,
                              static_cast<int>(ciphertextSize)) != 1) {
            return std::nullopt;
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        return std::nullopt;
    }
    // Authentication failure surfaces here
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    out.resize(total);
    return out;
}

} // namespace

OpenSslIdentity OpenSslIdentity::generate() {
    OpenSslIdentity identity;
    PkeyPtr signing = generateKey(EVP_PKEY_ED25519);
    PkeyPtr agreement = generateKey(EVP_PKEY_X25519);
    if (!identity.setKeys(rawPrivate(signing.get()), rawPrivate(agreement.get()))) {
        throw std::runtime_error("Failed to initialize generated identity");
    }
    return identity;
}

std::optional<OpenSslIdentity> OpenSslIdentity::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        Logger::error("Failed to open identity file: " + path);
        return std::nullopt;
    }

    try {
        json j;
        file >> j;
        auto signing = utils::fromHex(j.at("ed25519_private").get<std::string>());
        auto agreement = utils::fromHex(j.at("x25519_private").get<std::string>());
        if (!signing || !agreement) {
            Logger::error("Identity file contains malformed keys: " + path);
            return std::nullopt;
        }

        OpenSslIdentity identity;
        if (!identity.setKeys(*signing, *agreement)) {
            Logger::error("Identity file contains invalid keys: " + path);
            return std::nullopt;
        }
        return identity;
    } catch (const std::exception& e) {
        Logger::error("Failed to parse identity file " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool OpenSslIdentity::save(const std::string& path) const {
    if (!available_) {
        Logger::error("Cannot save an empty identity");
        return false;
    }

    json j = {
        {"public_key", publicKey()},
        {"ed25519_private", utils::toHex(signingPrivate_)},
        {"x25519_private", utils::toHex(agreementPrivate_)}
    };
    std::string text = j.dump(4);
    if (!utils::writeFile(path, Bytes(text.begin(), text.end()))) {
        return false;
    }

    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        Logger::warning("Failed to restrict identity file permissions: " + ec.message());
    }
    return true;
}

bool OpenSslIdentity::setKeys(const Bytes& signingPrivate, const Bytes& agreementPrivate) {
    if (signingPrivate.size() != kKeySize || agreementPrivate.size() != kKeySize) {
        return false;
    }
    PkeyPtr signing = privateKey(EVP_PKEY_ED25519, signingPrivate);
    PkeyPtr agreement = privateKey(EVP_PKEY_X25519, agreementPrivate);
    if (!signing || !agreement) {
        return false;
    }

    signingPrivate_ = signingPrivate;
    agreementPrivate_ = agreementPrivate;
    signingPublic_ = rawPublic(signing.get());
    agreementPublic_ = rawPublic(agreement.get());
    available_ = true;
    return true;
}

std::string OpenSslIdentity::publicKey() const {
    if (!available_) {
        return "";
    }
    return utils::toHex(signingPublic_) + utils::toHex(agreementPublic_);
}

std::optional<SignedEvent> OpenSslIdentity::sign(int kind, const EventTags& tags,
                                                 const std::string& content,
                                                 int64_t createdAt) const {
    if (!available_) {
        Logger::error("Cannot sign event: no identity loaded");
        return std::nullopt;
    }

    SignedEvent event;
    event.pubkey = publicKey();
    event.createdAt = createdAt;
    event.kind = kind;
    event.tags = tags;
    event.content = content;
    event.id = event.computeId();

    auto idBytes = utils::fromHex(event.id);
    PkeyPtr key = privateKey(EVP_PKEY_ED25519, signingPrivate_);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!idBytes || !key || !ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        Logger::error("Failed to initialize event signing");
        return std::nullopt;
    }

    Bytes signature(64);
    size_t sigLen = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, idBytes->data(), idBytes->size()) != 1) {
        Logger::error("Failed to sign event");
        return std::nullopt;
    }
    signature.resize(sigLen);
    event.sig = utils::toHex(signature);
    return event;
}

bool OpenSslIdentity::verify(const SignedEvent& event) const {
    Bytes signingKey;
    Bytes agreementKey;
    if (!splitPublicKey(event.pubkey, signingKey, agreementKey)) {
        return false;
    }
    if (event.computeId() != event.id) {
        return false;
    }

    auto idBytes = utils::fromHex(event.id);
    auto signature = utils::fromHex(event.sig);
    PkeyPtr key = publicKeyFromRaw(EVP_PKEY_ED25519, signingKey);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!idBytes || !signature || !key || !ctx ||
        EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature->data(), signature->size(),
                            idBytes->data(), idBytes->size()) == 1;
}

std::optional<Bytes> OpenSslIdentity::encryptFor(const std::string& recipientPublicKey,
                                                 const Bytes& plaintext) const {
    Bytes recipientSigning;
    Bytes recipientAgreement;
    if (!splitPublicKey(recipientPublicKey, recipientSigning, recipientAgreement)) {
        Logger::error("Cannot encrypt: malformed recipient public key");
        return std::nullopt;
    }

    PkeyPtr ephemeral = generateKey(EVP_PKEY_X25519);
    PkeyPtr recipient = publicKeyFromRaw(EVP_PKEY_X25519, recipientAgreement);
    if (!recipient) {
        Logger::error("Cannot encrypt: invalid recipient agreement key");
        return std::nullopt;
    }

    auto shared = deriveShared(ephemeral.get(), recipient.get());
    if (!shared) {
        Logger::error("Key agreement failed");
        return std::nullopt;
    }

    Bytes ephemeralPublic = rawPublic(ephemeral.get());
    Bytes salt(ephemeralPublic);
    salt.insert(salt.end(), recipientAgreement.begin(), recipientAgreement.end());
    auto key = hkdfSha256(*shared, salt, kFileKeyInfo);
    if (!key) {
        Logger::error("Key derivation failed");
        return std::nullopt;
    }

    auto sealed = aesGcmSeal(*key, plaintext);
    if (!sealed) {
        Logger::error("Payload encryption failed");
        return std::nullopt;
    }

    Bytes out(ephemeralPublic);
    out.insert(out.end(), sealed->begin(), sealed->end());
    return out;
}

std::optional<Bytes> OpenSslIdentity::decrypt(const Bytes& ciphertext) const {
    if (!available_ || ciphertext.size() < kKeySize + kNonceSize + kTagSize) {
        return std::nullopt;
    }

    Bytes ephemeralPublic(ciphertext.begin(), ciphertext.begin() + kKeySize);
    PkeyPtr ephemeral = publicKeyFromRaw(EVP_PKEY_X25519, ephemeralPublic);
    PkeyPtr own = privateKey(EVP_PKEY_X25519, agreementPrivate_);
    if (!ephemeral || !own) {
        return std::nullopt;
    }

    auto shared = deriveShared(own.get(), ephemeral.get());
    if (!shared) {
        return std::nullopt;
    }

    Bytes salt(ephemeralPublic);
    salt.insert(salt.end(), agreementPublic_.begin(), agreementPublic_.end());
    auto key = hkdfSha256(*shared, salt, kFileKeyInfo);
    if (!key) {
        return std::nullopt;
    }
    return aesGcmOpen(*key, ciphertext.data() + kKeySize, ciphertext.size() - kKeySize);
}

Bytes OpenSslIdentity::manifestKey() const {
    std::string context(kManifestKeyContext);
    Bytes material(context.begin(), context.end());
    material.insert(material.end(), agreementPrivate_.begin(), agreementPrivate_.end());

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_Digest(material.data(), material.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Manifest key derivation failed");
    }
    return Bytes(hash, hash + hashLen);
}

std::optional<Bytes> OpenSslIdentity::encryptManifest(const Bytes& plaintext) const {
    if (!available_) {
        Logger::error("Cannot encrypt manifest: no identity loaded");
        return std::nullopt;
    }
    return aesGcmSeal(manifestKey(), plaintext);
}

std::optional<Bytes> OpenSslIdentity::decryptManifest(const Bytes& ciphertext) const {
    if (!available_) {
        return std::nullopt;
    }
    return aesGcmOpen(manifestKey(), ciphertext.data(), ciphertext.size());
}
