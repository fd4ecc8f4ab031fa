/**
 * @file test_transform_chain.cpp
 * @brief Unit tests for transform stages and TransformChain
 *
 * Tests:
 * - Stage lookup by name
 * - Construct/deconstruct inversion across chain configurations
 * - Stage order (reverse on construct, forward on deconstruct)
 * - Failure reporting with the failing stage
 */

#include <gtest/gtest.h>
#include "harbor/transformer.hpp"
#include "harbor/transformers.hpp"
#include "harbor/crypto.hpp"
#include "harbor/errors.hpp"

#include <string>
#include <vector>

using namespace harbor;

class TransformChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());
        key_ = Crypto::derive_pre_shared_key("merlin");
    }

    // Message with a random payload
    static Message random_message(size_t payload_size) {
        Message message;
        message.agent_id = "4c3f0b2e-1d7a-4f58-9a62-0e9b7d2c6a15";
        message.type = MessageType::CHECKIN;
        message.payload = Crypto::generate_random_bytes(payload_size);
        message.padding = std::string(payload_size % 17, 'p');
        return message;
    }

    std::vector<uint8_t> key_;
};

// ============================================================================
// Stage Lookup Tests
// ============================================================================

TEST_F(TransformChainTest, MakeTransformerKnownNames) {
    for (const auto& name : transformer_names()) {
        auto stage = make_transformer(name);
        ASSERT_NE(stage, nullptr);
        EXPECT_EQ(stage->name(), name);
    }
}

TEST_F(TransformChainTest, MakeTransformerCaseInsensitive) {
    EXPECT_EQ(make_transformer(" AES ")->name(), "aes");
    EXPECT_EQ(make_transformer("Gob-Base")->name(), "gob-base");
}

TEST_F(TransformChainTest, MakeTransformerUnknownName) {
    EXPECT_THROW(make_transformer("rot13"), ValidationError);
    EXPECT_THROW(make_transformer(""), ValidationError);
}

TEST_F(TransformChainTest, ParseKeepsConfiguredOrder) {
    auto chain = TransformChain::parse("aes,base64-byte,gob-base");
    EXPECT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain.names(), (std::vector<std::string>{"aes", "base64-byte", "gob-base"}));
    EXPECT_EQ(chain.to_string(), "aes,base64-byte,gob-base");
}

TEST_F(TransformChainTest, ParseRejectsUnknownName) {
    EXPECT_THROW(TransformChain::parse("aes,bogus,gob-base"), ValidationError);
    EXPECT_THROW(TransformChain::parse(""), ValidationError);
    EXPECT_THROW(TransformChain::parse("aes,,gob-base"), ValidationError);
}

// ============================================================================
// Inversion Tests
// ============================================================================

TEST_F(TransformChainTest, RoundTripAcrossChains) {
    const std::vector<std::string> chains = {
        "gob-base",
        "aes,gob-base",
        "base64-byte,gob-base",
        "hex-byte,aes,gob-base",
        "aes,base64-byte,gob-base",
        "xor,hex-byte,gob-base",
        "base64-byte,xor,aes,gob-base"
    };

    for (const auto& transforms : chains) {
        auto chain = TransformChain::parse(transforms);
        for (size_t size : {0u, 1u, 31u, 512u, 4096u}) {
            Message message = random_message(size);
            auto wire = chain.construct(message, key_);
            EXPECT_EQ(chain.deconstruct(wire, key_), message) << transforms << " size " << size;
        }
    }
}

TEST_F(TransformChainTest, AesOutputDiffersPerCall) {
    auto chain = TransformChain::parse("aes,gob-base");
    Message message = random_message(64);

    // Fresh nonce each time
    EXPECT_NE(chain.construct(message, key_), chain.construct(message, key_));
}

TEST_F(TransformChainTest, OuterStageIsFirstConfigured) {
    auto chain = TransformChain::parse("hex-byte,gob-base");
    auto wire = chain.construct(random_message(16), key_);

    // The first-configured stage produced the wire bytes
    std::string text(wire.begin(), wire.end());
    EXPECT_EQ(text.find_first_not_of("0123456789abcdef"), std::string::npos);
}

// ============================================================================
// Failure Tests
// ============================================================================

TEST_F(TransformChainTest, EmptyChainFails) {
    TransformChain chain;
    EXPECT_TRUE(chain.empty());
    EXPECT_THROW(chain.construct(random_message(8), key_), TransformError);
    EXPECT_THROW(chain.deconstruct({1, 2, 3}, key_), TransformError);
}

TEST_F(TransformChainTest, WrongKeyFails) {
    auto chain = TransformChain::parse("aes,gob-base");
    auto wire = chain.construct(random_message(32), key_);

    EXPECT_THROW(chain.deconstruct(wire, Crypto::derive_pre_shared_key("other")), TransformError);
}

TEST_F(TransformChainTest, MissingKeyFails) {
    auto chain = TransformChain::parse("aes,gob-base");
    EXPECT_THROW(chain.construct(random_message(32), {}), TransformError);
}

TEST_F(TransformChainTest, TamperedWireFails) {
    auto chain = TransformChain::parse("aes,gob-base");
    auto wire = chain.construct(random_message(32), key_);
    wire[wire.size() / 2] ^= 0x01;

    EXPECT_THROW(chain.deconstruct(wire, key_), TransformError);
}

TEST_F(TransformChainTest, ChainWithoutMessageEncoderFails) {
    // No stage accepts the structured message
    auto chain = TransformChain::parse("aes,base64-byte");
    EXPECT_THROW(chain.construct(random_message(8), key_), TransformError);

    std::string encoded = "aGVsbG8=";
    std::vector<uint8_t> wire(encoded.begin(), encoded.end());
    EXPECT_THROW(TransformChain::parse("base64-byte").deconstruct(wire, key_), TransformError);
}

TEST_F(TransformChainTest, MessageBeforeLastStageFails) {
    auto inner = TransformChain::parse("gob-base");
    auto wire = inner.construct(random_message(8), key_);

    auto chain = TransformChain::parse("gob-base,base64-byte");
    EXPECT_THROW(chain.deconstruct(wire, key_), TransformError);
}

TEST_F(TransformChainTest, ErrorNamesFailingStage) {
    auto chain = TransformChain::parse("hex-byte,gob-base");
    std::string bad = "not hex";

    try {
        chain.deconstruct(std::vector<uint8_t>(bad.begin(), bad.end()), key_);
        FAIL() << "expected TransformError";
    } catch (const TransformError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("stage 1"), std::string::npos);
        EXPECT_NE(what.find("hex-byte"), std::string::npos);
    }
}

// ============================================================================
// Stage Tests
// ============================================================================

TEST_F(TransformChainTest, XorRequiresKey) {
    XorEncrypter stage;
    EXPECT_THROW(stage.construct(std::vector<uint8_t>{1, 2, 3}, {}), TransformError);
    EXPECT_THROW(stage.deconstruct({1, 2, 3}, {}), TransformError);
}

TEST_F(TransformChainTest, AesRejectsShortCiphertext) {
    AesEncrypter stage;
    EXPECT_THROW(stage.deconstruct(std::vector<uint8_t>(10, 0), key_), TransformError);
}

TEST_F(TransformChainTest, ByteStageRejectsMessageInput) {
    Base64Encoder stage;
    EXPECT_THROW(stage.construct(random_message(4), key_), TransformError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
