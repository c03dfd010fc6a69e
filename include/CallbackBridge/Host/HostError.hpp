#ifndef CALLBACK_BRIDGE_HOST_HOSTERROR_HPP
#define CALLBACK_BRIDGE_HOST_HOSTERROR_HPP
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

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace CallbackBridge
{
  /// @brief Failure details the host publishes through the ambient error slot.
  struct HostError
  {
    /// @brief The host supplied message, when there is one.
    std::optional<std::string> Message;
    /// @brief What the host calls the error object itself, used when no message is supplied.
    std::string Description{"[object Object]"};

    HostError() = default;

    explicit HostError(std::string message)
      : Message(std::move(message))
    {
    }

    HostError(std::optional<std::string> message, std::string description)
      : Message(std::move(message))
      , Description(std::move(description))
    {
    }

    bool operator==(const HostError&) const = default;
  };

  /// @brief Exception an adapted call is rejected with when the host reported a failure.
  ///
  /// what() is the host message, or "Error thrown by API <description>" when the host did not supply one.
  class HostErrorException : public std::runtime_error
  {
    HostError m_error;

  public:
    explicit HostErrorException(HostError error);

    /// @brief The raw error as read from the ambient error slot.
    [[nodiscard]] const HostError& GetError() const noexcept
    {
      return m_error;
    }

    /// @brief Builds the rejection message for an error.
    static std::string FormatMessage(const HostError& error);
  };
}

#endif
