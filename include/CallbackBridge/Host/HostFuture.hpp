#ifndef CALLBACK_BRIDGE_HOST_HOSTFUTURE_HPP
#define CALLBACK_BRIDGE_HOST_HOSTFUTURE_HPP
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

#include <CallbackBridge/Host/HostValue.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <utility>

namespace CallbackBridge
{
  /// @brief Deferred host value returned by an adapted host function.
  ///
  /// Wraps a std::shared_future so the same settlement can be observed from several copies of the HostValue
  /// that carries it. The future resolves with the normalized completion payload or rejects with the exception
  /// that ended the operation, rethrown with its original type.
  class HostFuture
  {
    std::shared_future<HostValue> m_future;

  public:
    explicit HostFuture(std::shared_future<HostValue> future)
      : m_future(std::move(future))
    {
    }

    /// @brief Checks if the operation has settled (resolved or rejected).
    [[nodiscard]] bool IsReady() const
    {
      return m_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    /// @brief Blocks until settled and returns the value.
    /// @throws The rejection reason if the operation was rejected.
    [[nodiscard]] const HostValue& Get() const
    {
      return m_future.get();
    }

    [[nodiscard]] const std::shared_future<HostValue>& GetFuture() const noexcept
    {
      return m_future;
    }
  };

  /// @brief Convenience for extracting the future from a value returned by an adapted function.
  /// @throws HostValueTypeException if the value does not carry a future.
  inline const HostFuture& AsHostFuture(const HostValue& value)
  {
    return *value.AsFuture();
  }
}

#endif
