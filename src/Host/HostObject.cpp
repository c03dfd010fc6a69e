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

#include <CallbackBridge/Host/HostObject.hpp>
#include <CallbackBridge/Host/HostValueTypeException.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace CallbackBridge
{
  void HostObject::Set(const std::string& name, HostValue value)
  {
    if (auto* property = FindOwn(name))
    {
      property->Value = std::move(value);
      return;
    }
    m_properties.emplace_back(name, std::move(value), true);
  }

  void HostObject::Define(const std::string& name, HostValue value, const bool enumerable)
  {
    if (auto* property = FindOwn(name))
    {
      property->Value = std::move(value);
      property->Enumerable = enumerable;
      return;
    }
    m_properties.emplace_back(name, std::move(value), enumerable);
  }

  bool HostObject::Remove(std::string_view name)
  {
    auto itr = std::find_if(m_properties.begin(), m_properties.end(), [name](const HostProperty& entry) { return entry.Name == name; });
    if (itr == m_properties.end())
    {
      return false;
    }
    m_properties.erase(itr);
    return true;
  }

  HostValue HostObject::Get(std::string_view name) const
  {
    const HostObject* current = this;
    while (current != nullptr)
    {
      if (const auto* property = current->FindOwn(name))
      {
        return property->Value;
      }
      current = current->m_prototype.get();
    }
    return {};
  }

  std::optional<HostValue> HostObject::GetOwn(std::string_view name) const
  {
    if (const auto* property = FindOwn(name))
    {
      return property->Value;
    }
    return std::nullopt;
  }

  bool HostObject::HasOwnProperty(std::string_view name) const noexcept
  {
    return FindOwn(name) != nullptr;
  }

  bool HostObject::IsEnumerable(std::string_view name) const noexcept
  {
    const auto* property = FindOwn(name);
    return property != nullptr && property->Enumerable;
  }

  std::vector<std::string> HostObject::OwnKeys() const
  {
    std::vector<std::string> keys;
    keys.reserve(m_properties.size());
    for (const auto& property : m_properties)
    {
      if (property.Enumerable)
      {
        keys.push_back(property.Name);
      }
    }
    return keys;
  }

  HostValue HostObject::Call(std::string_view name, HostArgs args) const
  {
    HostValue member = Get(name);
    if (!member.IsCallable())
    {
      throw HostValueTypeException(fmt::format("Property '{}' is not a function (found {})", name, ToString(member.Kind())));
    }
    return member(std::move(args));
  }

  const HostProperty* HostObject::FindOwn(std::string_view name) const noexcept
  {
    for (const auto& property : m_properties)
    {
      if (property.Name == name)
      {
        return &property;
      }
    }
    return nullptr;
  }

  HostProperty* HostObject::FindOwn(std::string_view name) noexcept
  {
    for (auto& property : m_properties)
    {
      if (property.Name == name)
      {
        return &property;
      }
    }
    return nullptr;
  }

  std::shared_ptr<HostObject> ResolvePath(const std::shared_ptr<HostObject>& root, std::string_view path)
  {
    std::shared_ptr<HostObject> current = root;
    std::size_t start = 0;
    while (current && start <= path.size())
    {
      const std::size_t end = std::min(path.find('.', start), path.size());
      const std::string_view segment = path.substr(start, end - start);
      if (segment.empty())
      {
        return nullptr;
      }

      HostValue next = current->Get(segment);
      if (!next.IsObject())
      {
        return nullptr;
      }
      current = next.AsObject();
      start = end + 1;
    }
    return current;
  }
}
