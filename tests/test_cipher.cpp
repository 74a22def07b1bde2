/**
 * @file test_cipher.cpp
 * @brief PacketCipher key derivation and authenticated encryption
 */

#include <gtest/gtest.h>
#include "rdx_cipher.hpp"
#include "rdx_errors.hpp"

using namespace rdx;

class CipherTest : public ::testing::Test {
protected:
    Bytes salt_ = Bytes(32, 0x42);
    Bytes message_ = Bytes{'h', 'e', 'l', 'l', 'o', ' ', 'r', 'd', 'x'};
};

TEST_F(CipherTest, EncryptDecrypt) {
    PacketCipher cipher("shared secret", salt_);
    Bytes sealed = cipher.encrypt(message_);

    EXPECT_EQ(sealed.size(), PacketCipher::NONCE_SIZE + message_.size() + PacketCipher::TAG_SIZE);
    EXPECT_EQ(cipher.decrypt(sealed), message_);
}

TEST_F(CipherTest, FreshNoncePerPacket) {
    PacketCipher cipher("shared secret", salt_);
    EXPECT_NE(cipher.encrypt(message_), cipher.encrypt(message_));
}

TEST_F(CipherTest, SameKeyAndSaltInteroperate) {
    PacketCipher sender("shared secret", salt_, 2000);
    PacketCipher receiver("shared secret", salt_, 2000);
    EXPECT_EQ(receiver.decrypt(sender.encrypt(message_)), message_);
}

TEST_F(CipherTest, DifferentKeyOrSaltFails) {
    PacketCipher sender("shared secret", salt_);
    PacketCipher wrong_key("other secret", salt_);
    PacketCipher wrong_salt("shared secret", Bytes(32, 0x43));

    Bytes sealed = sender.encrypt(message_);
    EXPECT_THROW(wrong_key.decrypt(sealed), CipherError);
    EXPECT_THROW(wrong_salt.decrypt(sealed), CipherError);
}

TEST_F(CipherTest, TamperedCiphertextFails) {
    PacketCipher cipher("shared secret", salt_);
    Bytes sealed = cipher.encrypt(message_);
    sealed[PacketCipher::NONCE_SIZE] ^= 0x01;

    EXPECT_THROW(cipher.decrypt(sealed), CipherError);
}

TEST_F(CipherTest, TruncatedInputFails) {
    PacketCipher cipher("shared secret", salt_);
    EXPECT_THROW(cipher.decrypt(Bytes(PacketCipher::NONCE_SIZE + PacketCipher::TAG_SIZE - 1)),
                 CipherError);
}

TEST_F(CipherTest, EmptyPlaintext) {
    PacketCipher cipher("shared secret", salt_);
    Bytes sealed = cipher.encrypt(Bytes());
    EXPECT_TRUE(cipher.decrypt(sealed).empty());
}

TEST_F(CipherTest, InvalidParameters) {
    EXPECT_THROW(PacketCipher("", salt_), CipherError);
    EXPECT_THROW(PacketCipher("key", salt_, 0), CipherError);
}

TEST_F(CipherTest, GeneratedSalts) {
    Bytes a = PacketCipher::generate_salt();
    Bytes b = PacketCipher::generate_salt();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);

    PacketCipher cipher("k", a, 1000);
    EXPECT_EQ(cipher.salt(), a);
    EXPECT_EQ(cipher.iterations(), 1000);
}
