#include "core/Cancellation.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace image_mcp;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.throw_if_cancelled());
}

TEST(CancellationTest, TokensShareTheSourceFlag) {
    CancellationSource source;
    CancellationToken first = source.token();
    CancellationToken copy = first;

    EXPECT_FALSE(first.is_cancelled());
    EXPECT_FALSE(source.is_cancelled());

    source.cancel();

    EXPECT_TRUE(source.is_cancelled());
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(copy.is_cancelled());
    EXPECT_THROW(copy.throw_if_cancelled(), OperationCancelled);
}

TEST(CancellationTest, TokenOutlivesSource) {
    CancellationToken token;
    {
        CancellationSource source;
        token = source.token();
        source.cancel();
    }
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTest, CancelIsVisibleAcrossThreads) {
    CancellationSource source;
    CancellationToken token = source.token();

    std::thread worker([&token]() {
        while (!token.is_cancelled()) {
            std::this_thread::yield();
        }
    });

    source.cancel();
    worker.join();
    SUCCEED();
}
