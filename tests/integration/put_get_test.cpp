/**
 * @file put_get_test.cpp
 * @brief PUT / GET round trips through the loopback store
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "neoload/client/client.h"
#include "neoload/client/loopback_store.h"
#include "neoload/client/metrics.h"
#include "neoload/common/checksum.h"
#include "neoload/common/crypto.h"
#include "neoload/common/limits.h"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace neoload;

namespace {

constexpr int64_t CHUNK_SIZE = 1024;
constexpr uint64_t MAX_OBJECT_SIZE = 4 * 1024 + 3;

} // anonymous namespace

class PutGetTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoopbackOptions options;
        options.max_object_size = MAX_OBJECT_SIZE;
        options.epoch = 10;
        store_ = std::make_shared<LoopbackStore>(options);
        metrics_ = std::make_shared<MetricsRegistry>();

        key_ = std::make_shared<const crypto::PrivateKey>(crypto::PrivateKey::Generate());
        TokenLifetime lifetime;
        lifetime.issued_at = 10;
        lifetime.not_before = 10;
        lifetime.expiration = 20;
        auto base = SessionToken::CreateTemplate(
            *key_, crypto::PublicKey::FromPrivateKey(*key_).ToCompressed(), lifetime);

        client_ = std::make_unique<Client>(store_, key_, base, metrics_);
        client_->SetBufferSize(CHUNK_SIZE);

        container_ = ContainerID::FromBytes(crypto::RandomBytes(limits::CONTAINER_ID_SIZE));
        owner_ = OwnerID::FromPublicKey(crypto::PublicKey::FromPrivateKey(*key_));
    }

    std::shared_ptr<LoopbackStore> store_;
    std::shared_ptr<MetricsRegistry> metrics_;
    std::shared_ptr<const crypto::PrivateKey> key_;
    std::unique_ptr<Client> client_;
    ContainerID container_;
    OwnerID owner_;
};

class PutGetSizeTest : public PutGetTest, public ::testing::WithParamInterface<uint64_t> {};

// ============================================================================
// Round trips over payload sizes
// ============================================================================

TEST_P(PutGetSizeTest, DirectPutThenGet) {
    auto payload = crypto::RandomBytes(GetParam());
    Context ctx;

    auto put = client_->Put(ctx, container_.ToString(), {{"FileName", "payload.bin"}}, payload);
    ASSERT_TRUE(put.success) << put.error;

    auto get = client_->Get(ctx, container_.ToString(), put.object_id);
    ASSERT_TRUE(get.success) << get.error;
    EXPECT_EQ(get.bytes_received, payload.size());
    EXPECT_EQ(get.payload_size, payload.size());

    auto id = ObjectID::DecodeString(put.object_id);
    EXPECT_EQ(*store_->Payload(container_, id), payload);

    // The store completed the delegated header under the session token
    auto stored = store_->HeadObject(container_, id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->Header().owner, owner_);
    EXPECT_EQ(stored->Header().creation_epoch, 10u);
    ASSERT_TRUE(stored->Header().session_token.has_value());
    EXPECT_EQ(stored->Header().session_token->Verb(), ObjectVerb::Put);
    EXPECT_NO_THROW(VerifyObject(*stored));
}

TEST_P(PutGetSizeTest, PreparedPutThenGet) {
    auto payload = crypto::RandomBytes(GetParam());
    Context ctx;

    auto prepared = client_->Prepare(ctx, container_.ToString(), payload);
    auto put = prepared.Put(ctx, {{"FileName", "payload.bin"}});
    ASSERT_TRUE(put.success) << put.error;

    auto get = client_->Get(ctx, container_.ToString(), put.object_id);
    ASSERT_TRUE(get.success) << get.error;
    EXPECT_EQ(get.bytes_received, payload.size());
    EXPECT_EQ(get.payload_size, payload.size());
    EXPECT_EQ(*store_->Payload(container_, ObjectID::DecodeString(put.object_id)), payload);
}

INSTANTIATE_TEST_SUITE_P(
    PayloadSizes,
    PutGetSizeTest,
    ::testing::Values(0, 1, CHUNK_SIZE - 1, CHUNK_SIZE, CHUNK_SIZE + 1, MAX_OBJECT_SIZE)
);

// ============================================================================
// Prepared objects
// ============================================================================

TEST_F(PutGetTest, PreparedIdentityMatchesStore) {
    Context ctx;
    auto prepared = client_->Prepare(ctx, container_.ToString(), crypto::RandomBytes(3000));
    auto put = prepared.Put(ctx, {{"Index", "0"}});
    ASSERT_TRUE(put.success) << put.error;

    auto id = ObjectID::DecodeString(put.object_id);
    auto stored = store_->HeadObject(container_, id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored->ID(), id);
    EXPECT_EQ(ComputeObjectID(stored->Header()), id);
    EXPECT_EQ(stored->GetSignature()->key, crypto::PublicKey::FromPrivateKey(*key_).ToCompressed());
    EXPECT_FALSE(stored->Header().session_token.has_value());
}

TEST_F(PutGetTest, PreparedPutTwiceWithDifferentAttributes) {
    Context ctx;
    auto payload = crypto::RandomBytes(2500);
    auto prepared = client_->Prepare(ctx, container_.ToString(), payload);

    auto first = prepared.Put(ctx, {{"Index", "1"}});
    auto second = prepared.Put(ctx, {{"Index", "2"}});
    ASSERT_TRUE(first.success) << first.error;
    ASSERT_TRUE(second.success) << second.error;
    EXPECT_NE(first.object_id, second.object_id);

    auto a = store_->HeadObject(container_, ObjectID::DecodeString(first.object_id));
    auto b = store_->HeadObject(container_, ObjectID::DecodeString(second.object_id));
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->Header().payload_checksum, b->Header().payload_checksum);
    EXPECT_EQ(a->Header().homomorphic_checksum, b->Header().homomorphic_checksum);
    EXPECT_EQ(store_->ObjectCount(), 2u);
}

TEST_F(PutGetTest, PreparedPutSameAttributesIsIdempotent) {
    Context ctx;
    auto prepared = client_->Prepare(ctx, container_.ToString(), crypto::RandomBytes(100));

    auto first = prepared.Put(ctx, {{"Index", "1"}});
    auto second = prepared.Put(ctx, {{"Index", "1"}});
    EXPECT_EQ(first.object_id, second.object_id);
    EXPECT_EQ(store_->ObjectCount(), 1u);
}

TEST_F(PutGetTest, HomomorphicHashingDisabledNetwork) {
    LoopbackOptions options;
    options.homomorphic_hashing_disabled = true;
    auto store = std::make_shared<LoopbackStore>(options);
    Client client(store, key_, SessionToken::CreateTemplate(
        *key_, crypto::PublicKey::FromPrivateKey(*key_).ToCompressed(), TokenLifetime{100, 0, 0}), metrics_);

    Context ctx;
    auto prepared = client.Prepare(ctx, container_.ToString(), crypto::RandomBytes(64));
    EXPECT_FALSE(prepared.Header().homomorphic_checksum.has_value());

    auto put = prepared.Put(ctx, {});
    ASSERT_TRUE(put.success) << put.error;
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PutGetTest, PrepareOverLimit) {
    Context ctx;
    EXPECT_THROW(client_->Prepare(ctx, container_.ToString(), crypto::RandomBytes(MAX_OBJECT_SIZE + 1)),
                 PayloadTooLarge);
    EXPECT_EQ(store_->ObjectCount(), 0u);
}

TEST_F(PutGetTest, DirectPutOverLimitRejectedByStore) {
    Context ctx;
    auto put = client_->Put(ctx, container_.ToString(), {}, crypto::RandomBytes(MAX_OBJECT_SIZE + 1));

    EXPECT_FALSE(put.success);
    EXPECT_EQ(put.error_kind, ErrorKind::Transport);
    EXPECT_NE(put.error.find("bigger than network limit"), std::string::npos);
    EXPECT_EQ(metrics_->Counter(metrics::OBJ_PUT_FAILS), 1u);
    EXPECT_EQ(store_->ObjectCount(), 0u);
}

TEST_F(PutGetTest, StoreRejectsPayloadNotMatchingChecksum) {
    auto payload = crypto::RandomBytes(100);
    auto sums = ComputeChecksums(payload, true);
    ObjectHeader header = ObjectBuilder::BuildHeader(
        container_, owner_, payload.size(), 10, sums.payload, sums.homomorphic);
    Object object = ObjectBuilder(*key_).Finalize(header, {});

    auto tampered = payload;
    tampered[50] ^= 0xFF;

    Context ctx;
    auto stream = store_->OpenPutStream(ctx, nullptr);
    ASSERT_TRUE(stream->WriteHeader(ctx, object));
    ASSERT_TRUE(stream->WriteChunk(ctx, tampered.data(), 40));
    ASSERT_TRUE(stream->WriteChunk(ctx, tampered.data() + 40, 60));
    try {
        stream->Close(ctx);
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid payload checksum"), std::string::npos);
    }
    EXPECT_EQ(store_->ObjectCount(), 0u);
}

TEST_F(PutGetTest, StoreRejectsShortPayload) {
    auto payload = crypto::RandomBytes(100);
    auto sums = ComputeChecksums(payload, true);
    ObjectHeader header = ObjectBuilder::BuildHeader(
        container_, owner_, payload.size(), 10, sums.payload, sums.homomorphic);
    Object object = ObjectBuilder(*key_).Finalize(header, {});

    Context ctx;
    auto stream = store_->OpenPutStream(ctx, nullptr);
    ASSERT_TRUE(stream->WriteHeader(ctx, object));
    ASSERT_TRUE(stream->WriteChunk(ctx, payload.data(), 99));
    try {
        stream->Close(ctx);
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("declares 100 payload bytes, received 99"), std::string::npos);
    }
    EXPECT_EQ(store_->ObjectCount(), 0u);
}

TEST_F(PutGetTest, GetMissingObject) {
    Context ctx;
    auto missing = ObjectID::FromBytes(crypto::RandomBytes(limits::OBJECT_ID_SIZE));
    auto get = client_->Get(ctx, container_.ToString(), missing.ToString());

    EXPECT_FALSE(get.success);
    EXPECT_EQ(get.error_kind, ErrorKind::Transport);
    EXPECT_NE(get.error.find("not found"), std::string::npos);
    EXPECT_EQ(metrics_->Counter(metrics::OBJ_GET_FAILS), 1u);
}

TEST_F(PutGetTest, ExpiredSessionTokenDenied) {
    Context ctx;
    auto put = client_->Put(ctx, container_.ToString(), {}, crypto::RandomBytes(10));
    ASSERT_TRUE(put.success) << put.error;

    store_->SetEpoch(21);
    auto get = client_->Get(ctx, container_.ToString(), put.object_id);
    EXPECT_FALSE(get.success);
    EXPECT_NE(get.error.find("access denied"), std::string::npos);

    auto late = client_->Put(ctx, container_.ToString(), {}, crypto::RandomBytes(10));
    EXPECT_FALSE(late.success);
}

TEST_F(PutGetTest, MetricsAccounting) {
    Context ctx;
    auto payload = crypto::RandomBytes(2 * CHUNK_SIZE + 5);
    auto put = client_->Put(ctx, container_.ToString(), {}, payload);
    ASSERT_TRUE(put.success) << put.error;
    ASSERT_TRUE(client_->Get(ctx, container_.ToString(), put.object_id).success);

    EXPECT_EQ(metrics_->Counter(metrics::OBJ_PUT_TOTAL), 1u);
    EXPECT_EQ(metrics_->Counter(metrics::OBJ_PUT_FAILS), 0u);
    EXPECT_EQ(metrics_->Trend(metrics::OBJ_PUT_DURATION).count, 1u);
    EXPECT_EQ(metrics_->Counter(metrics::OBJ_GET_TOTAL), 1u);
    EXPECT_EQ(metrics_->Trend(metrics::OBJ_GET_DURATION).count, 1u);
    EXPECT_EQ(metrics_->DataSent(), payload.size());
    EXPECT_EQ(metrics_->DataReceived(), payload.size());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(PutGetTest, ConcurrentPreparedPuts) {
    Context setup;
    auto prepared = client_->Prepare(setup, container_.ToString(), crypto::RandomBytes(2048));

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 10; i++) {
                Context ctx;
                auto put = prepared.Put(ctx, {{"Worker", std::to_string(t)}, {"Index", std::to_string(i)}});
                if (put.success) {
                    succeeded++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 40);
    EXPECT_EQ(store_->ObjectCount(), 40u);
    EXPECT_EQ(metrics_->Counter(metrics::OBJ_PUT_TOTAL), 40u);
}

TEST_F(PutGetTest, ConcurrentDirectPutsAndGets) {
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 5; i++) {
                Context ctx;
                auto payload = crypto::RandomBytes(1500);
                auto put = client_->Put(ctx, container_.ToString(), {}, payload);
                if (!put.success) {
                    continue;
                }
                auto get = client_->Get(ctx, container_.ToString(), put.object_id);
                if (get.success && get.bytes_received == payload.size()) {
                    succeeded++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 20);
}
