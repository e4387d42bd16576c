#include <gtest/gtest.h>
#include "identity/openssl_identity.hpp"
#include "common/utils.hpp"
#include <filesystem>

class IdentityTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = OpenSslIdentity::generate();
        bob_ = OpenSslIdentity::generate();
    }

    Bytes bytesOf(const std::string& text) {
        return Bytes(text.begin(), text.end());
    }

    OpenSslIdentity alice_;
    OpenSslIdentity bob_;
};

TEST_F(IdentityTest, PublicKeyCarriesBothKeys) {
    EXPECT_TRUE(alice_.isAvailable());
    EXPECT_EQ(alice_.publicKey().size(), 128u);
    EXPECT_NE(alice_.publicKey(), bob_.publicKey());
}

TEST_F(IdentityTest, SignedEventVerifiesWithAnyIdentity) {
    auto event = alice_.sign(kBackupEventKind, {{"action", "backup_invite"}, {"target", "BASE1"}}, "");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->pubkey, alice_.publicKey());
    EXPECT_EQ(event->id, event->computeId());
    EXPECT_EQ(event->getTagValue("target").value_or(""), "BASE1");
    EXPECT_FALSE(event->getTagValue("missing").has_value());

    EXPECT_TRUE(alice_.verify(*event));
    EXPECT_TRUE(bob_.verify(*event));
}

TEST_F(IdentityTest, TamperedEventFailsVerification) {
    auto event = alice_.sign(kBackupEventKind, {{"action", "backup_invite"}}, "hello");
    ASSERT_TRUE(event.has_value());

    SignedEvent changedContent = *event;
    changedContent.content = "hullo";
    EXPECT_FALSE(bob_.verify(changedContent));

    // Recomputing the id does not help without the private key
    changedContent.id = changedContent.computeId();
    EXPECT_FALSE(bob_.verify(changedContent));

    SignedEvent otherKey = *event;
    otherKey.pubkey = bob_.publicKey();
    otherKey.id = otherKey.computeId();
    EXPECT_FALSE(alice_.verify(otherKey));

    SignedEvent badSig = *event;
    badSig.sig = std::string(128, '0');
    EXPECT_FALSE(alice_.verify(badSig));
}

TEST_F(IdentityTest, EncryptForOnlyRecipientCanDecrypt) {
    Bytes plaintext = bytesOf("ten bytes!");
    auto ciphertext = alice_.encryptFor(bob_.publicKey(), plaintext);
    ASSERT_TRUE(ciphertext.has_value());
    EXPECT_EQ(ciphertext->size(), plaintext.size() + 60);

    auto opened = bob_.decrypt(*ciphertext);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, plaintext);

    EXPECT_FALSE(alice_.decrypt(*ciphertext).has_value());

    Bytes flipped = *ciphertext;
    flipped[flipped.size() / 2] ^= 0x01;
    EXPECT_FALSE(bob_.decrypt(flipped).has_value());
}

TEST_F(IdentityTest, ManifestKeyIsPrivateToIdentity) {
    Bytes manifest = bytesOf("{\"version\":\"1.0\"}");
    auto sealed = alice_.encryptManifest(manifest);
    ASSERT_TRUE(sealed.has_value());

    auto opened = alice_.decryptManifest(*sealed);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, manifest);
    EXPECT_FALSE(bob_.decryptManifest(*sealed).has_value());
}

TEST_F(IdentityTest, SaveAndLoadKeepsKeys) {
    auto path = std::filesystem::temp_directory_path() / ("peervault_identity_" + utils::randomHex(6) + ".json");
    ASSERT_TRUE(alice_.save(path.string()));

    auto loaded = OpenSslIdentity::load(path.string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->publicKey(), alice_.publicKey());

    auto sealed = alice_.encryptManifest(bytesOf("state"));
    ASSERT_TRUE(sealed.has_value());
    EXPECT_TRUE(loaded->decryptManifest(*sealed).has_value());

    std::filesystem::remove(path);
}

TEST_F(IdentityTest, EmptyIdentityCannotSign) {
    OpenSslIdentity empty;
    EXPECT_FALSE(empty.isAvailable());
    EXPECT_TRUE(empty.publicKey().empty());
    EXPECT_FALSE(empty.sign(kBackupEventKind, {}, "").has_value());
    EXPECT_FALSE(empty.save("/tmp/never-written.json"));
    EXPECT_FALSE(OpenSslIdentity::load("/nonexistent/identity.json").has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
