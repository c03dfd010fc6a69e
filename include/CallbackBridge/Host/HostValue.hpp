#ifndef CALLBACK_BRIDGE_HOST_HOSTVALUE_HPP
#define CALLBACK_BRIDGE_HOST_HOSTVALUE_HPP
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

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace CallbackBridge
{
  class HostFuture;
  class HostObject;
  class HostValue;

  /// @brief Ordered positional argument list passed to a host function.
  using HostArgs = std::vector<HostValue>;

  /// @brief A host-provided (or adapted) callable. Host methods are variadic, so the signature is fully dynamic.
  using HostFunction = std::function<HostValue(HostArgs)>;

  struct UndefinedValue
  {
    bool operator==(const UndefinedValue&) const noexcept = default;
  };

  struct NullValue
  {
    bool operator==(const NullValue&) const noexcept = default;
  };

  enum class HostValueKind
  {
    Undefined,
    Null,
    Boolean,
    Integer,
    Number,
    String,
    List,
    Object,
    Function,
    Future
  };

  /// @brief Returns a human readable name for the kind, used in diagnostics.
  std::string_view ToString(const HostValueKind kind) noexcept;

  /// @brief Runtime-tagged value exchanged with the host environment.
  ///
  /// Objects, functions and futures are reference types: copies share the same underlying instance and
  /// equality compares identity. All other kinds are plain values.
  class HostValue
  {
  public:
    using List = std::vector<HostValue>;

  private:
    std::variant<UndefinedValue, NullValue, bool, int64_t, double, std::string, List, std::shared_ptr<HostObject>,
                 std::shared_ptr<HostFunction>, std::shared_ptr<HostFuture>>
      m_value;

  public:
    HostValue() = default;
    HostValue(NullValue value);
    HostValue(const bool value);

    /// @brief Stores any integral value as a 64-bit signed integer. Unsigned values above INT64_MAX wrap.
    template <typename TInteger>
      requires(std::is_integral_v<TInteger> && !std::is_same_v<TInteger, bool>)
    HostValue(const TInteger value)
      : m_value(static_cast<int64_t>(value))
    {
    }

    HostValue(const double value);
    HostValue(const char* const value);
    HostValue(std::string value);
    HostValue(List value);
    HostValue(std::shared_ptr<HostObject> value);

    /// @brief Wraps any callable with the host function signature.
    template <typename TFunc>
      requires(!std::is_same_v<std::decay_t<TFunc>, HostValue> && std::is_invocable_r_v<HostValue, TFunc&, HostArgs>)
    HostValue(TFunc func)
      : m_value(std::make_shared<HostFunction>(std::move(func)))
    {
    }

    HostValue(std::shared_ptr<HostFuture> value);

    [[nodiscard]] HostValueKind Kind() const noexcept;

    [[nodiscard]] bool IsUndefined() const noexcept
    {
      return Kind() == HostValueKind::Undefined;
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
      return Kind() == HostValueKind::Null;
    }

    /// @brief Checks the runtime kind for a callable, which is how a trailing callback is told apart from data.
    [[nodiscard]] bool IsCallable() const noexcept
    {
      return Kind() == HostValueKind::Function;
    }

    [[nodiscard]] bool IsObject() const noexcept
    {
      return Kind() == HostValueKind::Object;
    }

    [[nodiscard]] bool IsFuture() const noexcept
    {
      return Kind() == HostValueKind::Future;
    }

    /// @throws HostValueTypeException if the value is not of the requested kind.
    [[nodiscard]] bool AsBoolean() const;
    [[nodiscard]] int64_t AsInteger() const;
    /// @brief Numeric access, integers are widened.
    [[nodiscard]] double AsNumber() const;
    [[nodiscard]] const std::string& AsString() const;
    [[nodiscard]] const List& AsList() const;
    [[nodiscard]] const std::shared_ptr<HostObject>& AsObject() const;
    [[nodiscard]] const HostFunction& AsFunction() const;
    [[nodiscard]] const std::shared_ptr<HostFuture>& AsFuture() const;

    /// @brief Invokes a Function value.
    /// @throws HostValueTypeException if the value is not callable.
    HostValue operator()(HostArgs args) const;

    bool operator==(const HostValue& other) const noexcept;
    bool operator!=(const HostValue& other) const noexcept
    {
      return !(*this == other);
    }

    /// @brief Debug description, not a serialization format.
    [[nodiscard]] std::string ToString() const;
  };

  inline constexpr NullValue Null{};
}

#endif
