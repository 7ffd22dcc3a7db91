#include "../src/correlator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace offload_cpp;
using namespace offload_cpp::detail;

TEST(JobCorrelator, ids_are_unique_and_prefixed) {
    auto c = JobCorrelator{"job"};
    EXPECT_EQ(c.next_id(), "job-1");
    EXPECT_EQ(c.next_id(), "job-2");
}

TEST(JobCorrelator, routes_reply_to_its_handler) {
    auto c = JobCorrelator{"job"};
    auto a = std::vector<FromWorkerMessage>{};
    auto b = std::vector<FromWorkerMessage>{};
    c.expect("job-1", [&](const FromWorkerMessage& m) { a.push_back(m); });
    c.expect("job-2", [&](const FromWorkerMessage& m) { b.push_back(m); });

    EXPECT_TRUE(c.route(JobResult{"job-2", 5}));
    EXPECT_TRUE(a.empty());
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(std::get<JobResult>(b[0]).result, 5);
}

TEST(JobCorrelator, keeps_routing_until_forgotten) {
    auto c = JobCorrelator{"s"};
    auto chunks = 0;
    c.expect("s-1", [&](const FromWorkerMessage&) { ++chunks; });
    c.route(Chunk{"s-1", 1});
    c.route(Chunk{"s-1", 2});
    EXPECT_EQ(chunks, 2);

    c.forget("s-1");
    EXPECT_FALSE(c.expecting("s-1"));
    EXPECT_FALSE(c.route(Chunk{"s-1", 3}));
    EXPECT_EQ(chunks, 2);
}

TEST(JobCorrelator, late_and_uncorrelated_replies_are_not_routed) {
    auto c = JobCorrelator{"job"};
    EXPECT_FALSE(c.route(JobResult{"job-99", 1}));
    EXPECT_FALSE(c.route(Ready{"init-0-1"}));
    EXPECT_FALSE(c.route(WorkerFailure{std::nullopt, "crash"}));
}

TEST(JobCorrelator, handler_may_forget_itself) {
    auto c = JobCorrelator{"job"};
    auto seen = 0;
    c.expect("job-1", [&](const FromWorkerMessage&) {
        c.forget("job-1");
        ++seen;
    });
    EXPECT_TRUE(c.route(JobResult{"job-1", 1}));
    EXPECT_EQ(seen, 1);
    EXPECT_EQ(c.pending(), 0u);
}

TEST(JobCorrelator, clear_drops_every_waiter) {
    auto c = JobCorrelator{"job"};
    c.expect("a", [](const FromWorkerMessage&) {});
    c.expect("b", [](const FromWorkerMessage&) {});
    EXPECT_EQ(c.pending(), 2u);
    c.clear();
    EXPECT_EQ(c.pending(), 0u);
}
