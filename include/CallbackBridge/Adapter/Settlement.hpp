#ifndef CALLBACK_BRIDGE_ADAPTER_SETTLEMENT_HPP
#define CALLBACK_BRIDGE_ADAPTER_SETTLEMENT_HPP
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

#include <atomic>
#include <exception>
#include <future>
#include <utility>

namespace CallbackBridge::Detail
{
  /// @brief Single-assignment wrapper around std::promise.
  ///
  /// The first Resolve or Reject wins, later calls are ignored. A host that fires its completion callback more
  /// than once, or throws after completing, therefore cannot trigger promise_already_satisfied.
  template <typename T>
  class Settlement
  {
    std::promise<T> m_promise;
    std::atomic<bool> m_settled{false};

  public:
    Settlement() = default;

    Settlement(const Settlement&) = delete;
    Settlement& operator=(const Settlement&) = delete;
    Settlement(Settlement&&) = delete;
    Settlement& operator=(Settlement&&) = delete;

    /// @brief Gets the future. May only be called once.
    std::future<T> GetFuture()
    {
      return m_promise.get_future();
    }

    /// @return true if this call settled the promise.
    template <typename... TValue>
    bool Resolve(TValue&&... value)
    {
      if (m_settled.exchange(true))
      {
        return false;
      }
      m_promise.set_value(std::forward<TValue>(value)...);
      return true;
    }

    /// @return true if this call settled the promise.
    bool Reject(std::exception_ptr error)
    {
      if (m_settled.exchange(true))
      {
        return false;
      }
      m_promise.set_exception(std::move(error));
      return true;
    }

    [[nodiscard]] bool IsSettled() const noexcept
    {
      return m_settled.load();
    }
  };
}

#endif
