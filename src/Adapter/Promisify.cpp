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
#include <CallbackBridge/Adapter/Settlement.hpp>
#include <CallbackBridge/Host/HostError.hpp>
#include <CallbackBridge/Host/LastError.hpp>
#include <exception>
#include <memory>
#include <utility>

namespace CallbackBridge
{
  namespace
  {
    using HostSettlement = Detail::Settlement<HostValue>;

    HostFunction CreateCompletionCallback(std::shared_ptr<HostSettlement> settlement, HostValue secondaryCallback)
    {
      return [settlement = std::move(settlement), secondaryCallback = std::move(secondaryCallback)](HostArgs results) -> HostValue
      {
        if (secondaryCallback.IsCallable())
        {
          try
          {
            secondaryCallback(results);
          }
          catch (...)
          {
            // A throwing secondary callback rejects the future
            settlement->Reject(std::current_exception());
            return {};
          }
        }

        // The slot is only valid until control returns to the host
        std::optional<HostError> error = LastError::Read();
        if (error.has_value())
        {
          settlement->Reject(std::make_exception_ptr(HostErrorException(std::move(*error))));
        }
        else
        {
          settlement->Resolve(NormalizeCompletionPayload(std::move(results)));
        }
        return {};
      };
    }
  }

  HostValue NormalizeCompletionPayload(HostArgs results)
  {
    switch (results.size())
    {
    case 0:
      return {};
    case 1:
      return std::move(results.front());
    default:
      return HostValue(std::move(results));
    }
  }

  HostFunction Promisify(HostFunction callbackApi)
  {
    auto api = std::make_shared<const HostFunction>(std::move(callbackApi));
    return [api](HostArgs args) -> HostValue
    {
      HostValue secondaryCallback;
      if (!args.empty() && args.back().IsCallable())
      {
        secondaryCallback = std::move(args.back());
        args.pop_back();
      }

      auto settlement = std::make_shared<HostSettlement>();
      auto future = std::make_shared<HostFuture>(settlement->GetFuture().share());

      args.emplace_back(CreateCompletionCallback(settlement, std::move(secondaryCallback)));
      try
      {
        (*api)(std::move(args));
      }
      catch (...)
      {
        // Also covers a host that completed and then threw, the settlement ignores the late rejection
        settlement->Reject(std::current_exception());
      }
      return HostValue(std::move(future));
    };
  }
}
