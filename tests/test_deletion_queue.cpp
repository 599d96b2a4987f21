/// @file test_deletion_queue.cpp
/// @brief Unit tests for latentsky::core::DeletionQueue.

#include <doctest/doctest.h>

#include "core/deletion_queue.hpp"

#include <string>
#include <vector>

using latentsky::core::DeletionQueue;

TEST_CASE("Flush releases newest first")
{
    std::vector<std::string> released;

    DeletionQueue queue;
    queue.push("buffer", [&released] { released.emplace_back("buffer"); });
    queue.push("pipeline", [&released] { released.emplace_back("pipeline"); });
    queue.push("descriptor pool", [&released] { released.emplace_back("descriptor pool"); });
    CHECK(queue.size() == 3);

    queue.flush();

    REQUIRE(released.size() == 3);
    CHECK(released[0] == "descriptor pool");
    CHECK(released[1] == "pipeline");
    CHECK(released[2] == "buffer");
    CHECK(queue.empty());
}

TEST_CASE("Second flush is a no-op")
{
    int calls = 0;

    DeletionQueue queue;
    queue.push("counter", [&calls] { ++calls; });
    queue.flush();
    queue.flush();

    CHECK(calls == 1);
}

TEST_CASE("Destructor flushes pending releases")
{
    int calls = 0;
    {
        DeletionQueue queue;
        queue.push("a", [&calls] { ++calls; });
        queue.push("b", [&calls] { ++calls; });
    }
    CHECK(calls == 2);
}
