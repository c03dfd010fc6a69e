#ifndef CALLBACK_BRIDGE_HOST_LASTERROR_HPP
#define CALLBACK_BRIDGE_HOST_LASTERROR_HPP
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
#include <optional>

namespace CallbackBridge
{
  /// @brief The ambient error slot the host fills in when an operation failed.
  ///
  /// The slot is thread scoped. The host populates it right before invoking a completion callback and empties it
  /// once the callback returns, so it must be read inside the callback. Use LastErrorScope on the host side rather
  /// than calling Set and Clear directly.
  namespace LastError
  {
    /// @brief Returns the current content of the slot without modifying it.
    [[nodiscard]] std::optional<HostError> Read();

    [[nodiscard]] bool IsSet() noexcept;

    void Set(HostError error);

    void Clear() noexcept;
  }

  /// @brief RAII helper a host uses to publish an error for the duration of a completion callback.
  ///
  /// The previous slot content is restored on destruction, so a completion that happens inside another
  /// completion callback does not erase the outer error.
  class LastErrorScope
  {
    std::optional<HostError> m_previous;

  public:
    /// @brief Publishes error, or an empty slot when error is nullopt.
    explicit LastErrorScope(std::optional<HostError> error);
    ~LastErrorScope();

    LastErrorScope(const LastErrorScope&) = delete;
    LastErrorScope& operator=(const LastErrorScope&) = delete;
    LastErrorScope(LastErrorScope&&) = delete;
    LastErrorScope& operator=(LastErrorScope&&) = delete;
  };
}

#endif
