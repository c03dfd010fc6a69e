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

#include <CallbackBridge/Host/HostError.hpp>
#include <CallbackBridge/Host/LastError.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace CallbackBridge
{
  class LastErrorTest : public ::testing::Test
  {
  protected:
    void TearDown() override
    {
      LastError::Clear();
    }
  };

  TEST_F(LastErrorTest, SetReadClear)
  {
    EXPECT_FALSE(LastError::IsSet());

    LastError::Set(HostError("boom"));
    ASSERT_TRUE(LastError::IsSet());
    EXPECT_EQ(LastError::Read(), HostError("boom"));
    // Reading does not consume the slot
    EXPECT_TRUE(LastError::IsSet());

    LastError::Clear();
    EXPECT_FALSE(LastError::Read().has_value());
  }

  TEST_F(LastErrorTest, Scope_RestoresPreviousValue)
  {
    {
      LastErrorScope outer(HostError("outer"));
      {
        LastErrorScope inner(HostError("inner"));
        EXPECT_EQ(LastError::Read(), HostError("inner"));
      }
      EXPECT_EQ(LastError::Read(), HostError("outer"));
      {
        LastErrorScope success(std::nullopt);
        EXPECT_FALSE(LastError::IsSet());
      }
      EXPECT_EQ(LastError::Read(), HostError("outer"));
    }
    EXPECT_FALSE(LastError::IsSet());
  }

  TEST(HostErrorTest, FormatMessage)
  {
    EXPECT_EQ(HostErrorException::FormatMessage(HostError("No tab with id: 5")), "No tab with id: 5");
    EXPECT_EQ(HostErrorException::FormatMessage(HostError()), "Error thrown by API [object Object]");
    EXPECT_EQ(HostErrorException::FormatMessage(HostError(std::string(), "QuotaExceeded")), "Error thrown by API QuotaExceeded");
  }

  TEST(HostErrorTest, Exception_CarriesError)
  {
    const HostError error(std::nullopt, "QuotaExceeded");
    const HostErrorException ex(error);

    EXPECT_STREQ(ex.what(), "Error thrown by API QuotaExceeded");
    EXPECT_EQ(ex.GetError(), error);
  }
}
