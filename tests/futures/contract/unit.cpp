#include <affine/futures/contract.hpp>
#include <affine/futures/future.hpp>

#include <affine/cancel/cancelled.hpp>
#include <affine/result/make/err.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace affine;  // NOLINT
using namespace std::chrono_literals;

//////////////////////////////////////////////////////////////////////

template <typename E, typename T>
std::string ErrorMessage(const Result<T>& result) {
  try {
    std::rethrow_exception(result.error());
  } catch (const E& e) {
    return e.what();
  }
}

//////////////////////////////////////////////////////////////////////

TEST_SUITE(Contract) {
  SIMPLE_TEST(JustWorks) {
    auto [f, p] = futures::Contract<int>();

    ASSERT_FALSE(f.IsReady());
    ASSERT_EQ(f.Peek(), futures::State::Pending);

    std::move(p).SetValue(7);

    ASSERT_TRUE(f.IsReady());
    ASSERT_EQ(f.Wait(), futures::State::Resolved);

    auto r = std::move(f).Get();

    ASSERT_TRUE(r);
    ASSERT_EQ(*r, 7);
  }

  SIMPLE_TEST(Error) {
    auto [f, p] = futures::Contract<int>();

    std::move(p).SetError(std::make_exception_ptr(std::runtime_error{"boom"}));

    ASSERT_EQ(f.Wait(), futures::State::Failed);

    auto r = std::move(f).Get();

    ASSERT_FALSE(r);
    ASSERT_EQ(ErrorMessage<std::runtime_error>(r), "boom");
  }

  SIMPLE_TEST(Unwrap) {
    auto [f, p] = futures::Contract<std::string>();

    std::move(p).SetError(
        std::make_exception_ptr(std::invalid_argument{"bad"}));

    ASSERT_THROW(result::Unwrap(std::move(f).Get()), std::invalid_argument);
  }

  SIMPLE_TEST(BrokenPromise) {
    auto [f, p] = futures::Contract<int>();

    {
      auto dropped = std::move(p);
    }

    ASSERT_EQ(f.Wait(), futures::State::Failed);

    auto r = std::move(f).Get();
    ASSERT_THROW(result::Unwrap(std::move(r)), futures::BrokenPromise);
  }

  SIMPLE_TEST(DropFuture) {
    auto [f, p] = futures::Contract<std::string>();

    {
      auto dropped = std::move(f);
    }

    // Nobody is listening
    std::move(p).SetValue("Hello");
  }

  SIMPLE_TEST(MoveFuture) {
    auto [f, p] = futures::Contract<int>();

    futures::Future<int> g = std::move(f);

    ASSERT_FALSE(f.Valid());  // NOLINT
    ASSERT_TRUE(g.Valid());

    std::move(p).SetValue(42);

    ASSERT_EQ(*std::move(g).Get(), 42);
    ASSERT_FALSE(g.Valid());  // NOLINT
  }

  SIMPLE_TEST(CrossThread) {
    auto [f, p] = futures::Contract<int>();

    twist::ed::stdlike::thread producer([p = std::move(p)]() mutable {
      std::this_thread::sleep_for(100ms);
      std::move(p).SetValue(11);
    });

    auto r = std::move(f).Get();

    ASSERT_TRUE(r);
    ASSERT_EQ(*r, 11);

    producer.join();
  }

  SIMPLE_TEST(WaitFor) {
    auto [f, p] = futures::Contract<int>();

    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(f.WaitFor(100ms));
    ASSERT_GE(std::chrono::steady_clock::now() - start, 100ms);

    std::move(p).SetValue(1);

    ASSERT_TRUE(f.WaitFor(0ms));
  }
}

//////////////////////////////////////////////////////////////////////

TEST_SUITE(SharedState) {
  using State = futures::detail::SharedState<int>;

  SIMPLE_TEST(FirstWriterWins) {
    auto* state = new State{};
    futures::Future<int> f{state};

    ASSERT_TRUE(state->TrySetValue(1));

    ASSERT_FALSE(state->TrySetValue(2));
    ASSERT_FALSE(state->TryCancel());
    ASSERT_FALSE(
        state->TrySetError(std::make_exception_ptr(std::runtime_error{"late"})));

    state->ReleaseRef();

    ASSERT_EQ(f.Peek(), futures::State::Resolved);
    ASSERT_EQ(*std::move(f).Get(), 1);
  }

  SIMPLE_TEST(CancelWins) {
    auto* state = new State{};
    futures::Future<int> f{state};

    ASSERT_TRUE(state->TryCancel());
    ASSERT_FALSE(state->TrySetValue(1));

    state->ReleaseRef();

    ASSERT_EQ(f.Wait(), futures::State::Cancelled);

    auto r = std::move(f).Get();
    ASSERT_FALSE(r);
    ASSERT_THROW(result::Unwrap(std::move(r)), cancel::CancelledException);
  }

  SIMPLE_TEST(ConsumerLeavesFirst) {
    auto* state = new State{};

    {
      futures::Future<int> f{state};
    }

    ASSERT_TRUE(state->TrySetValue(3));
    state->ReleaseRef();
  }
}

RUN_ALL_TESTS()
