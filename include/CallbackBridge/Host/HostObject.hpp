#ifndef CALLBACK_BRIDGE_HOST_HOSTOBJECT_HPP
#define CALLBACK_BRIDGE_HOST_HOSTOBJECT_HPP
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
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CallbackBridge
{
  /// @brief A named property slot owned directly by a HostObject.
  struct HostProperty
  {
    std::string Name;
    HostValue Value;
    bool Enumerable{true};

    HostProperty(std::string name, HostValue value, const bool enumerable)
      : Name(std::move(name))
      , Value(std::move(value))
      , Enumerable(enumerable)
    {
    }
  };

  /// @brief A host namespace or instance: an ordered set of own properties plus an optional shared prototype.
  ///
  /// Structurally identical objects (for example several storage areas) share their common methods through a
  /// prototype object. Lookups fall back to the prototype chain, while own-property queries never do.
  class HostObject
  {
    std::vector<HostProperty> m_properties;
    std::shared_ptr<HostObject> m_prototype;

  public:
    HostObject() = default;

    explicit HostObject(std::shared_ptr<HostObject> prototype)
      : m_prototype(std::move(prototype))
    {
    }

    HostObject(const HostObject&) = delete;
    HostObject& operator=(const HostObject&) = delete;
    HostObject(HostObject&&) = delete;
    HostObject& operator=(HostObject&&) = delete;

    /// @brief Creates or overwrites an own property. A new property is enumerable, an existing one keeps its flag.
    void Set(const std::string& name, HostValue value);

    /// @brief Creates or overwrites an own property with an explicit enumerable flag.
    void Define(const std::string& name, HostValue value, const bool enumerable);

    /// @brief Removes an own property.
    /// @return true if the property existed.
    bool Remove(std::string_view name);

    /// @brief Looks up a property on this object and then along the prototype chain.
    /// @return The value, or Undefined if no object in the chain has the property.
    [[nodiscard]] HostValue Get(std::string_view name) const;

    /// @brief Looks up an own property only.
    [[nodiscard]] std::optional<HostValue> GetOwn(std::string_view name) const;

    [[nodiscard]] bool HasOwnProperty(std::string_view name) const noexcept;

    /// @brief Checks if the own property exists and is enumerable.
    [[nodiscard]] bool IsEnumerable(std::string_view name) const noexcept;

    /// @brief Own enumerable property names in insertion order.
    [[nodiscard]] std::vector<std::string> OwnKeys() const;

    /// @brief Invokes the named property (own or inherited) with the given arguments.
    /// @throws HostValueTypeException if the property does not exist or is not callable.
    HostValue Call(std::string_view name, HostArgs args) const;

    [[nodiscard]] const std::shared_ptr<HostObject>& GetPrototype() const noexcept
    {
      return m_prototype;
    }

    void SetPrototype(std::shared_ptr<HostObject> prototype)
    {
      m_prototype = std::move(prototype);
    }

  private:
    [[nodiscard]] const HostProperty* FindOwn(std::string_view name) const noexcept;
    [[nodiscard]] HostProperty* FindOwn(std::string_view name) noexcept;
  };

  /// @brief Walks a dot separated path ("storage.sync") of object valued properties below root.
  /// @return The object at the end of the path, or null if root is null or any segment is missing or not an object.
  std::shared_ptr<HostObject> ResolvePath(const std::shared_ptr<HostObject>& root, std::string_view path);
}

#endif
