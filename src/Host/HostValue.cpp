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

#include <CallbackBridge/Host/HostFuture.hpp>
#include <CallbackBridge/Host/HostObject.hpp>
#include <CallbackBridge/Host/HostValue.hpp>
#include <CallbackBridge/Host/HostValueTypeException.hpp>
#include <fmt/format.h>
#include <utility>

namespace CallbackBridge
{
  namespace
  {
    [[noreturn]] void ThrowKindMismatch(const HostValueKind expected, const HostValueKind actual)
    {
      throw HostValueTypeException(fmt::format("Expected a host value of kind '{}' but got '{}'", ToString(expected), ToString(actual)));
    }
  }

  std::string_view ToString(const HostValueKind kind) noexcept
  {
    switch (kind)
    {
    case HostValueKind::Undefined:
      return "undefined";
    case HostValueKind::Null:
      return "null";
    case HostValueKind::Boolean:
      return "boolean";
    case HostValueKind::Integer:
      return "integer";
    case HostValueKind::Number:
      return "number";
    case HostValueKind::String:
      return "string";
    case HostValueKind::List:
      return "list";
    case HostValueKind::Object:
      return "object";
    case HostValueKind::Function:
      return "function";
    case HostValueKind::Future:
      return "future";
    }
    return "unknown";
  }

  HostValue::HostValue(NullValue value)
    : m_value(value)
  {
  }

  HostValue::HostValue(const bool value)
    : m_value(value)
  {
  }

  HostValue::HostValue(const double value)
    : m_value(value)
  {
  }

  HostValue::HostValue(const char* const value)
    : m_value(std::string(value != nullptr ? value : ""))
  {
  }

  HostValue::HostValue(std::string value)
    : m_value(std::move(value))
  {
  }

  HostValue::HostValue(List value)
    : m_value(std::move(value))
  {
  }

  HostValue::HostValue(std::shared_ptr<HostObject> value)
  {
    // A null object reference is the host's null
    if (value)
    {
      m_value = std::move(value);
    }
    else
    {
      m_value = NullValue{};
    }
  }

  HostValue::HostValue(std::shared_ptr<HostFuture> value)
  {
    if (value)
    {
      m_value = std::move(value);
    }
    else
    {
      m_value = NullValue{};
    }
  }

  HostValueKind HostValue::Kind() const noexcept
  {
    return static_cast<HostValueKind>(m_value.index());
  }

  bool HostValue::AsBoolean() const
  {
    if (const auto* value = std::get_if<bool>(&m_value))
    {
      return *value;
    }
    ThrowKindMismatch(HostValueKind::Boolean, Kind());
  }

  int64_t HostValue::AsInteger() const
  {
    if (const auto* value = std::get_if<int64_t>(&m_value))
    {
      return *value;
    }
    ThrowKindMismatch(HostValueKind::Integer, Kind());
  }

  double HostValue::AsNumber() const
  {
    if (const auto* value = std::get_if<double>(&m_value))
    {
      return *value;
    }
    if (const auto* value = std::get_if<int64_t>(&m_value))
    {
      return static_cast<double>(*value);
    }
    ThrowKindMismatch(HostValueKind::Number, Kind());
  }

  const std::string& HostValue::AsString() const
  {
    if (const auto* value = std::get_if<std::string>(&m_value))
    {
      return *value;
    }
    ThrowKindMismatch(HostValueKind::String, Kind());
  }

  const HostValue::List& HostValue::AsList() const
  {
    if (const auto* value = std::get_if<List>(&m_value))
    {
      return *value;
    }
    ThrowKindMismatch(HostValueKind::List, Kind());
  }

  const std::shared_ptr<HostObject>& HostValue::AsObject() const
  {
    if (const auto* value = std::get_if<std::shared_ptr<HostObject>>(&m_value))
    {
      return *value;
    }
    ThrowKindMismatch(HostValueKind::Object, Kind());
  }

  const HostFunction& HostValue::AsFunction() const
  {
    if (const auto* value = std::get_if<std::shared_ptr<HostFunction>>(&m_value))
    {
      return **value;
    }
    ThrowKindMismatch(HostValueKind::Function, Kind());
  }

  const std::shared_ptr<HostFuture>& HostValue::AsFuture() const
  {
    if (const auto* value = std::get_if<std::shared_ptr<HostFuture>>(&m_value))
    {
      return *value;
    }
    ThrowKindMismatch(HostValueKind::Future, Kind());
  }

  HostValue HostValue::operator()(HostArgs args) const
  {
    return AsFunction()(std::move(args));
  }

  bool HostValue::operator==(const HostValue& other) const noexcept
  {
    // Reference kinds hold shared_ptr, so variant equality compares identity for them
    return m_value == other.m_value;
  }

  std::string HostValue::ToString() const
  {
    switch (Kind())
    {
    case HostValueKind::Undefined:
      return "undefined";
    case HostValueKind::Null:
      return "null";
    case HostValueKind::Boolean:
      return AsBoolean() ? "true" : "false";
    case HostValueKind::Integer:
      return fmt::format("{}", AsInteger());
    case HostValueKind::Number:
      return fmt::format("{}", AsNumber());
    case HostValueKind::String:
      return fmt::format("\"{}\"", AsString());
    case HostValueKind::List:
    {
      std::string result = "[";
      const auto& list = AsList();
      for (std::size_t i = 0; i < list.size(); ++i)
      {
        if (i > 0)
        {
          result += ", ";
        }
        result += list[i].ToString();
      }
      result += "]";
      return result;
    }
    case HostValueKind::Object:
      return fmt::format("[object {}]", static_cast<const void*>(AsObject().get()));
    case HostValueKind::Function:
      return "[function]";
    case HostValueKind::Future:
      return "[future]";
    }
    return "unknown";
  }
}
