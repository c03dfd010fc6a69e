#ifndef CALLBACK_BRIDGE_HOST_HOSTVALUETYPEEXCEPTION_HPP
#define CALLBACK_BRIDGE_HOST_HOSTVALUETYPEEXCEPTION_HPP
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

#include <stdexcept>
#include <string>

namespace CallbackBridge
{
  /// @brief Exception thrown when a host value is accessed as a kind it does not hold.
  ///
  /// This is also thrown when calling a property that is missing or not callable.
  class HostValueTypeException : public std::logic_error
  {
  public:
    explicit HostValueTypeException(const std::string& message)
      : std::logic_error(message)
    {
    }
  };
}

#endif
