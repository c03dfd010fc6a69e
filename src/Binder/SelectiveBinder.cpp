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

#include <CallbackBridge/Adapter/Promisify.hpp>
#include <CallbackBridge/Binder/SelectiveBinder.hpp>
#include <CallbackBridge/Log/Logger.hpp>
#include <optional>

namespace CallbackBridge
{
  namespace
  {
    CALLBACK_BRIDGE_LOGGER_NAME(SelectiveBinder);
  }

  std::size_t BindKnownCallbacks(HostObject* target, const std::set<std::string>& known)
  {
    if (target == nullptr)
    {
      return 0;
    }

    const auto logger = Log::GetLogger<LoggerName_SelectiveBinder>();
    std::size_t converted = 0;

    // OwnKeys skips inherited and non-enumerable members
    for (const auto& name : target->OwnKeys())
    {
      if (known.find(name) == known.end())
      {
        continue;
      }

      std::optional<HostValue> member = target->GetOwn(name);
      if (!member.has_value() || !member->IsCallable())
      {
        logger->debug("BindKnownCallbacks: '{}' is not a function, left as {}", name, ToString(member.has_value() ? member->Kind() : HostValueKind::Undefined));
        continue;
      }

      target->Set(name, Promisify(member->AsFunction()));
      ++converted;
      logger->debug("BindKnownCallbacks: wrapped '{}' in a future", name);
    }
    return converted;
  }

  std::size_t AddAsyncWrappers(const std::shared_ptr<HostObject>& callbackApi, std::initializer_list<std::string> callbackFunctions)
  {
    if (!callbackApi)
    {
      return 0;
    }
    return BindKnownCallbacks(callbackApi.get(), std::set<std::string>(callbackFunctions));
  }

  std::size_t AddAsyncWrappers(std::span<const std::shared_ptr<HostObject>> callbackApis, const std::set<std::string>& callbackFunctions)
  {
    std::size_t converted = 0;
    for (const auto& callbackApi : callbackApis)
    {
      converted += BindKnownCallbacks(callbackApi.get(), callbackFunctions);
    }
    return converted;
  }
}
