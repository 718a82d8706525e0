#include <affine/satellite/logger.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <vector>

using namespace affine;  // NOLINT

TEST_SUITE(Logger) {
  SIMPLE_TEST(JustWorks) {
    satellite::Logger<true> logger({"Test"});

    logger.Increment("Test");

    auto data = logger.GatherMetrics().Data();

    ASSERT_EQ(data.size(), 1);

    auto [name, count] = data[0];

    ASSERT_EQ(name, "Test");
    ASSERT_EQ(count, 1);
  }

  SIMPLE_TEST(Transparent) {
    satellite::Logger<false> logger({"Test"});

    logger.Increment("Test", 5);
    // Names are not checked when collection is off
    logger.Increment("Missing");

    auto metrics = logger.GatherMetrics();

    ASSERT_EQ(metrics.Get("Test"), 0);
    ASSERT_TRUE(std::move(metrics).Data() == Unit{});
  }

  SIMPLE_TEST(RegistrationOrder) {
    satellite::Logger<true> logger({"Second", "First", "Third"});

    logger.Increment("First", 42);
    logger.Increment("Third", 37);

    auto data = logger.GatherMetrics().Data();

    ASSERT_EQ(data.size(), 3);

    ASSERT_EQ(data[0].first, "Second");
    ASSERT_EQ(data[0].second, 0);
    ASSERT_EQ(data[1].first, "First");
    ASSERT_EQ(data[1].second, 42);
    ASSERT_EQ(data[2].first, "Third");
    ASSERT_EQ(data[2].second, 37);
  }

  SIMPLE_TEST(Get) {
    satellite::Logger<true> logger({"Resolved", "Failed"});

    logger.Increment("Failed", 3);

    auto metrics = logger.GatherMetrics();

    ASSERT_EQ(metrics.Get("Resolved"), 0);
    ASSERT_EQ(metrics.Get("Failed"), 3);
    ASSERT_EQ(metrics.Get("Unknown"), 0);
  }

  SIMPLE_TEST(Snapshot) {
    satellite::Logger<true> logger({"Test"});

    logger.Increment("Test");
    auto before = logger.GatherMetrics();
    logger.Increment("Test");

    ASSERT_EQ(before.Get("Test"), 1);
    ASSERT_EQ(logger.GatherMetrics().Get("Test"), 2);
  }

  SIMPLE_TEST(ManyThreads) {
    static const size_t kThreads = 4;
    static const size_t kIncrements = 10'000;

    satellite::Logger<true> logger({"Test"});

    std::vector<twist::ed::stdlike::thread> threads;
    for (size_t i = 0; i < kThreads; ++i) {
      threads.emplace_back([&logger] {
        for (size_t j = 0; j < kIncrements; ++j) {
          logger.Increment("Test");
        }
      });
    }

    for (auto& t : threads) {
      t.join();
    }

    ASSERT_EQ(logger.GatherMetrics().Get("Test"), kThreads * kIncrements);
  }
}

RUN_ALL_TESTS()
