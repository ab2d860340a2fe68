/**
 * @file pending_requests_test.cpp
 * @brief Unit tests for PendingRequestStore and RequestIdSequence
 */

#include "session/pending_requests.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace tether;
using namespace tether::session;

TEST(RequestIdSequenceTest, IdsAreMonotonicIntegers) {
    RequestIdSequence ids;
    auto first = ids.next();
    auto second = ids.next();
    ASSERT_TRUE(first.is_integer());
    EXPECT_EQ(first.as_integer(), 1);
    EXPECT_EQ(second.as_integer(), 2);
}

TEST(RequestIdSequenceTest, ConcurrentCallersGetUniqueIds) {
    RequestIdSequence ids;
    std::vector<std::thread> threads;
    std::vector<std::vector<int64_t>> seen(4);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 500; ++i) {
                seen[t].push_back(ids.next().as_integer());
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    std::set<int64_t> unique;
    for (const auto &list : seen) {
        unique.insert(list.begin(), list.end());
    }
    EXPECT_EQ(unique.size(), 2000u);
}

TEST(PendingRequestStoreTest, ResolveCompletesOnce) {
    PendingRequestStore store;
    int calls = 0;
    std::optional<RequestResult> received;
    ASSERT_TRUE(store.add(rpc::MessageId(1), [&](RequestResult result) {
        ++calls;
        received = std::move(result);
    }));
    EXPECT_TRUE(store.contains(rpc::MessageId(1)));

    EXPECT_TRUE(store.resolve(rpc::MessageId(1), RequestResult::success(rpc::Response{rpc::MessageId(1), rpc::Json(5)})));
    EXPECT_FALSE(store.resolve(rpc::MessageId(1), RequestResult::success(rpc::Response{rpc::MessageId(1), rpc::Json(6)})));

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(received->ok());
    EXPECT_EQ(*received->response->result, rpc::Json(5));
    EXPECT_EQ(store.size(), 0u);
}

TEST(PendingRequestStoreTest, UnknownIdIsNotResolved) {
    PendingRequestStore store;
    EXPECT_FALSE(store.resolve(rpc::MessageId(42), RequestResult::failure(rpc::ClientError::disconnected())));
}

TEST(PendingRequestStoreTest, DuplicateIdIsRejectedAndCompletionKept) {
    PendingRequestStore store;
    ASSERT_TRUE(store.add(rpc::MessageId(1), [](RequestResult) {}));

    bool called = false;
    Completion second = [&](RequestResult) { called = true; };
    EXPECT_FALSE(store.add(rpc::MessageId(1), std::move(second)));

    // Still callable by the caller
    ASSERT_TRUE(static_cast<bool>(second));
    second(RequestResult::failure(rpc::ClientError::disconnected()));
    EXPECT_TRUE(called);
}

TEST(PendingRequestStoreTest, IntegerAndStringIdsDoNotCollide) {
    PendingRequestStore store;
    EXPECT_TRUE(store.add(rpc::MessageId(1), [](RequestResult) {}));
    EXPECT_TRUE(store.add(rpc::MessageId("1"), [](RequestResult) {}));
    EXPECT_EQ(store.size(), 2u);
}

TEST(PendingRequestStoreTest, FailAllCompletesEveryEntry) {
    PendingRequestStore store;
    int failures = 0;
    for (int i = 0; i < 5; ++i) {
        store.add(rpc::MessageId(i), [&](RequestResult result) {
            if (!result.ok() && result.error->kind == rpc::ErrorKind::DISCONNECTED) {
                ++failures;
            }
        });
    }

    EXPECT_EQ(store.fail_all(rpc::ClientError::disconnected()), 5u);
    EXPECT_EQ(failures, 5);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.fail_all(rpc::ClientError::disconnected()), 0u);
}

TEST(PendingRequestStoreTest, RemoveReturnsCompletionWithoutCalling) {
    PendingRequestStore store;
    bool called = false;
    store.add(rpc::MessageId(3), [&](RequestResult) { called = true; });

    auto completion = store.remove(rpc::MessageId(3));
    ASSERT_TRUE(completion.has_value());
    EXPECT_FALSE(called);
    EXPECT_FALSE(store.contains(rpc::MessageId(3)));
    EXPECT_FALSE(store.remove(rpc::MessageId(3)).has_value());
}

TEST(PendingRequestStoreTest, CompletionMayReenterStore) {
    PendingRequestStore store;
    store.add(rpc::MessageId(1), [&](RequestResult) { store.add(rpc::MessageId(2), [](RequestResult) {}); });

    EXPECT_TRUE(store.resolve(rpc::MessageId(1), RequestResult::failure(rpc::ClientError::disconnected())));
    EXPECT_TRUE(store.contains(rpc::MessageId(2)));
}

TEST(PendingRequestStoreTest, ConcurrentResolveAndFailAllCompleteExactlyOnce) {
    for (int round = 0; round < 50; ++round) {
        PendingRequestStore store;
        std::atomic<int> completions{0};
        for (int i = 0; i < 20; ++i) {
            store.add(rpc::MessageId(i), [&](RequestResult) { ++completions; });
        }

        std::thread resolver([&] {
            for (int i = 0; i < 20; ++i) {
                store.resolve(rpc::MessageId(i), RequestResult::success(rpc::Response{rpc::MessageId(i), std::nullopt}));
            }
        });
        store.fail_all(rpc::ClientError::disconnected());
        resolver.join();

        EXPECT_EQ(completions.load(), 20);
    }
}
