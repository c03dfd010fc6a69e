//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <CallbackBridge/Adapter/TypedPromisify.hpp>
#include <CallbackBridge/Host/HostError.hpp>
#include <CallbackBridge/Host/LastError.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>

namespace CallbackBridge
{
  static_assert(std::is_void_v<CompletionPayload_t<>>);
  static_assert(std::is_same_v<CompletionPayload_t<const std::string&>, std::string>);
  static_assert(std::is_same_v<CompletionPayload_t<int, bool>, std::tuple<int, bool>>);

  namespace
  {
    class NoSuchTabFault : public std::out_of_range
    {
    public:
      explicit NoSuchTabFault(int tabId)
        : std::out_of_range("no such tab")
        , TabId(tabId)
      {
      }

      int TabId;
    };

    /// @brief Completes synchronously, publishing error for the duration of the completion.
    template <typename... TResults>
    void CompleteWith(const std::function<void(TResults...)>& completion, std::optional<HostError> error, TResults... results)
    {
      LastErrorScope errorScope(std::move(error));
      completion(results...);
    }
  }

  class TypedPromisifyTest : public ::testing::Test
  {
  protected:
    void TearDown() override
    {
      LastError::Clear();
    }
  };

  TEST_F(TypedPromisifyTest, NoResults_ResolvesVoid)
  {
    auto clear = PromisifyTyped<void(), void()>([](std::function<void()> done) { CompleteWith<>(done, std::nullopt); });

    std::future<void> future = clear();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_NO_THROW(future.get());
  }

  TEST_F(TypedPromisifyTest, OneResult_ResolvesThatValue)
  {
    TypedCallbackAdapter<void(int, int), void(int)> add([](int lhs, int rhs, std::function<void(int)> done)
                                                        { CompleteWith<int>(done, std::nullopt, lhs + rhs); });

    std::future<int> future = add(40, 2);

    EXPECT_EQ(future.get(), 42);
  }

  TEST_F(TypedPromisifyTest, SeveralResults_ResolvesTuple)
  {
    auto split = PromisifyTyped<void(std::string), void(std::string, int)>(
      [](std::string text, std::function<void(std::string, int)> done)
      { CompleteWith<std::string, int>(done, std::nullopt, text.substr(0, 3), static_cast<int>(text.size())); });

    auto future = split("abcdef");

    const auto [prefix, length] = future.get();
    EXPECT_EQ(prefix, "abc");
    EXPECT_EQ(length, 6);
  }

  TEST_F(TypedPromisifyTest, HostError_Rejects)
  {
    auto get = PromisifyTyped<void(int), void(std::string)>([](int, std::function<void(std::string)> done)
                                                            { CompleteWith<std::string>(done, HostError("No tab with id: 3"), std::string()); });

    auto future = get(3);

    try
    {
      (void)future.get();
      FAIL() << "Expected HostErrorException";
    }
    catch (const HostErrorException& ex)
    {
      EXPECT_STREQ(ex.what(), "No tab with id: 3");
    }
  }

  TEST_F(TypedPromisifyTest, SynchronousThrow_Rejects)
  {
    bool completed = false;
    auto failing = PromisifyTyped<void(int), void(int)>(
      [&completed](int value, std::function<void(int)> done)
      {
        if (value < 0)
        {
          throw std::invalid_argument("negative");
        }
        completed = true;
        done(value);
      });

    auto future = failing(-1);

    EXPECT_THROW((void)future.get(), std::invalid_argument);
    EXPECT_FALSE(completed);
  }

  TEST_F(TypedPromisifyTest, SynchronousThrowOfDerivedFault_KeepsItsType)
  {
    auto get = PromisifyTyped<void(int), void(int)>([](int tabId, std::function<void(int)>) { throw NoSuchTabFault(tabId); });

    auto future = get(11);

    try
    {
      (void)future.get();
      FAIL() << "Expected NoSuchTabFault";
    }
    catch (const NoSuchTabFault& ex)
    {
      EXPECT_EQ(ex.TabId, 11);
    }
  }

  TEST_F(TypedPromisifyTest, SecondaryCallback_ReceivesResultsBeforeResolution)
  {
    std::function<void(int)> pending;
    TypedCallbackAdapter<void(), void(int)> next([&pending](std::function<void(int)> done) { pending = std::move(done); });
    int seen = 0;

    auto future = next([&seen](int value) { seen = value; });
    EXPECT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::timeout);

    CompleteWith<int>(pending, std::nullopt, 9);

    EXPECT_EQ(seen, 9);
    EXPECT_EQ(future.get(), 9);
  }

  TEST_F(TypedPromisifyTest, SecondaryCallbackThrows_Rejects)
  {
    TypedCallbackAdapter<void(), void(int)> next([](std::function<void(int)> done) { CompleteWith<int>(done, std::nullopt, 1); });

    auto future = next([](int) { throw std::runtime_error("callback defect"); });

    try
    {
      (void)future.get();
      FAIL() << "Expected the secondary callback fault";
    }
    catch (const std::runtime_error& ex)
    {
      EXPECT_STREQ(ex.what(), "callback defect");
    }
  }

  TEST_F(TypedPromisifyTest, SecondaryCallbackThrowsDerivedFault_KeepsItsType)
  {
    TypedCallbackAdapter<void(), void(int)> next([](std::function<void(int)> done) { CompleteWith<int>(done, std::nullopt, 4); });

    auto future = next([](int tabId) { throw NoSuchTabFault(tabId); });

    EXPECT_THROW((void)future.get(), NoSuchTabFault);
  }

  TEST_F(TypedPromisifyTest, SecondaryCallbackThrowsHostError_KeepsItsType)
  {
    TypedCallbackAdapter<void(), void(int)> next([](std::function<void(int)> done) { CompleteWith<int>(done, std::nullopt, 4); });

    auto future = next([](int) { throw HostErrorException(HostError("inner")); });

    EXPECT_THROW((void)future.get(), HostErrorException);
  }

  TEST_F(TypedPromisifyTest, RepeatedCompletion_SettlesOnce)
  {
    TypedCallbackAdapter<void(), void(int)> twice(
      [](std::function<void(int)> done)
      {
        CompleteWith<int>(done, std::nullopt, 1);
        CompleteWith<int>(done, std::nullopt, 2);
      });

    auto future = twice();

    EXPECT_EQ(future.get(), 1);
  }
}
