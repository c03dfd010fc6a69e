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

#include <CallbackBridge/Host/LastError.hpp>
#include <utility>

namespace CallbackBridge
{
  namespace
  {
    std::optional<HostError>& Slot() noexcept
    {
      thread_local std::optional<HostError> slot;
      return slot;
    }
  }

  namespace LastError
  {
    std::optional<HostError> Read()
    {
      return Slot();
    }

    bool IsSet() noexcept
    {
      return Slot().has_value();
    }

    void Set(HostError error)
    {
      Slot() = std::move(error);
    }

    void Clear() noexcept
    {
      Slot().reset();
    }
  }

  LastErrorScope::LastErrorScope(std::optional<HostError> error)
    : m_previous(std::exchange(Slot(), std::move(error)))
  {
  }

  LastErrorScope::~LastErrorScope()
  {
    Slot() = std::move(m_previous);
  }
}
