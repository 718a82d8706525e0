#include <affine/threads/blocking/wait_group.hpp>

#include <affine/timers/processors/standalone.hpp>

#include <wheels/test/framework.hpp>
#include <wheels/test/util/cpu_timer.hpp>

#include <chrono>
#include <thread>
#include <vector>

#if !defined(TWIST_FIBERS)

using namespace affine;  // NOLINT
using namespace std::chrono_literals;

using affine::threads::blocking::WaitGroup;
using affine::timers::StandaloneProcessor;

TEST_SUITE(Standalone) {
  template <typename F>
  struct Tester : public timers::TimerBase {
    explicit Tester(timers::Millis ms, F&& f)
        : delay_(ms),
          fun_(std::move(f)) {
    }

    timers::Millis GetDelay() override {
      return delay_;
    }

    void Run() noexcept override {
      fun_();
    }

    timers::Millis delay_;
    F fun_;
  };

  SIMPLE_TEST(JustWorks) {
    StandaloneProcessor proc;
    WaitGroup wg;

    Tester tester{5ms, [&] {
      wg.Done();
    }};

    wg.Add(1);

    proc.AddTimer(&tester);

    wg.Wait();

    ASSERT_EQ(proc.PendingTimers(), 0);
  }

  SIMPLE_TEST(CorrectDelay) {
    StandaloneProcessor proc;
    WaitGroup wg;
    wg.Add(1);

    Tester tester{300ms, [&wg] {
      wg.Done();
    }};

    auto start = std::chrono::steady_clock::now();

    proc.AddTimer(&tester);

    wg.Wait();

    timers::Millis elapsed =
        timers::ToMillis(std::chrono::steady_clock::now() - start);

    ASSERT_GE(elapsed, 300ms);
    ASSERT_LE(elapsed, 300ms + 50ms);
  }

  SIMPLE_TEST(DeadlineOrder) {
    StandaloneProcessor proc;
    WaitGroup wg;
    wg.Add(3);

    std::vector<int> fired;

    Tester third{150ms, [&] {
      fired.push_back(3);
      wg.Done();
    }};

    Tester first{50ms, [&] {
      fired.push_back(1);
      wg.Done();
    }};

    Tester second{100ms, [&] {
      fired.push_back(2);
      wg.Done();
    }};

    proc.AddTimer(&third);
    proc.AddTimer(&first);
    proc.AddTimer(&second);

    wg.Wait();

    ASSERT_EQ(fired, (std::vector<int>{1, 2, 3}));
  }

  SIMPLE_TEST(Cancel) {
    StandaloneProcessor proc;

    bool flag = false;

    Tester tester{100ms, [&] {
      flag = true;
    }};

    proc.AddTimer(&tester);

    ASSERT_EQ(proc.PendingTimers(), 1);
    ASSERT_TRUE(proc.CancelTimer(&tester));
    ASSERT_EQ(proc.PendingTimers(), 0);

    std::this_thread::sleep_for(200ms);

    ASSERT_FALSE(flag);
  }

  SIMPLE_TEST(CancelAfterFire) {
    StandaloneProcessor proc;
    WaitGroup wg;
    wg.Add(1);

    Tester tester{1ms, [&] {
      wg.Done();
    }};

    proc.AddTimer(&tester);

    wg.Wait();

    ASSERT_FALSE(proc.CancelTimer(&tester));
  }

  SIMPLE_TEST(CancelWaitsForRunningTimer) {
    StandaloneProcessor proc;

    bool done = false;

    Tester slow{1ms, [&] {
      std::this_thread::sleep_for(200ms);
      done = true;
    }};

    proc.AddTimer(&slow);

    std::this_thread::sleep_for(50ms);

    // Timer is running right now
    proc.CancelTimer(&slow);

    ASSERT_TRUE(done);
  }

  SIMPLE_TEST(Dtor) {
    bool flag = false;

    Tester test{10s, [&] {
      flag = true;
    }};

    {
      StandaloneProcessor proc;
      proc.AddTimer(&test);
    }

    // Pending timers never fire
    ASSERT_FALSE(flag);
  }

  SIMPLE_TEST(EarlierTimerWakesProcessor) {
    StandaloneProcessor proc;
    WaitGroup wg;

    Tester lazy{5s, [] {}};

    Tester eager{10ms, [&] {
      wg.Done();
    }};

    wg.Add(1);

    auto start = std::chrono::steady_clock::now();

    proc.AddTimer(&lazy);
    std::this_thread::sleep_for(10ms);
    proc.AddTimer(&eager);

    wg.Wait();

    ASSERT_LE(std::chrono::steady_clock::now() - start, 500ms);

    proc.CancelTimer(&lazy);
  }

  SIMPLE_TEST(DontWasteCPU) {
    wheels::ProcessCPUTimer cpu_timer;

    StandaloneProcessor proc;

    WaitGroup wg;
    wg.Add(1);

    Tester test{1s, [&] {
      wg.Done();
    }};

    proc.AddTimer(&test);

    wg.Wait();

    ASSERT_LE(cpu_timer.Spent(), 25ms);
  }
}

#endif

RUN_ALL_TESTS()
