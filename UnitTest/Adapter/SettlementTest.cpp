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

#include <CallbackBridge/Adapter/Settlement.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <exception>
#include <stdexcept>

namespace CallbackBridge::Detail
{
  TEST(SettlementTest, FirstResolveWins)
  {
    Settlement<int> settlement;
    auto future = settlement.GetFuture();

    EXPECT_TRUE(settlement.Resolve(1));
    EXPECT_FALSE(settlement.Resolve(2));
    EXPECT_FALSE(settlement.Reject(std::make_exception_ptr(std::runtime_error("late"))));

    EXPECT_TRUE(settlement.IsSettled());
    EXPECT_EQ(future.get(), 1);
  }

  TEST(SettlementTest, FirstRejectWins)
  {
    Settlement<int> settlement;
    auto future = settlement.GetFuture();

    EXPECT_TRUE(settlement.Reject(std::make_exception_ptr(std::runtime_error("first"))));
    EXPECT_FALSE(settlement.Resolve(2));

    EXPECT_THROW(future.get(), std::runtime_error);
  }

  TEST(SettlementTest, VoidSettlement)
  {
    Settlement<void> settlement;
    auto future = settlement.GetFuture();

    EXPECT_FALSE(settlement.IsSettled());
    EXPECT_TRUE(settlement.Resolve());

    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_NO_THROW(future.get());
  }
}
