#ifndef CALLBACK_BRIDGE_ADAPTER_TYPEDPROMISIFY_HPP
#define CALLBACK_BRIDGE_ADAPTER_TYPEDPROMISIFY_HPP
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

#include <CallbackBridge/Adapter/Settlement.hpp>
#include <CallbackBridge/Host/HostError.hpp>
#include <CallbackBridge/Host/LastError.hpp>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace CallbackBridge
{
  namespace Detail
  {
    // Payload a completion with the given result types resolves with: void, the single value, or a tuple
    template <typename... TResults>
    struct CompletionPayload
    {
      using type = std::tuple<std::decay_t<TResults>...>;
    };

    template <>
    struct CompletionPayload<>
    {
      using type = void;
    };

    template <typename TResult>
    struct CompletionPayload<TResult>
    {
      using type = std::decay_t<TResult>;
    };
  }    // namespace Detail

  template <typename... TResults>
  using CompletionPayload_t = typename Detail::CompletionPayload<TResults...>::type;

  template <typename TSignature, typename TCompletion>
  class TypedCallbackAdapter;

  /// @brief Statically typed counterpart of Promisify for host functions with a fixed signature.
  ///
  /// Wraps an operation of the form void(TArgs..., std::function<void(TResults...)>) and exposes two call
  /// operators, with and without a trailing secondary callback, so the trailing handler is told apart from data
  /// by overload resolution instead of runtime inspection. Settlement rules are the same as Promisify:
  /// synchronous throw rejects, a throwing secondary callback rejects, otherwise LastError is read once and
  /// decides between rejection with HostErrorException and resolution with the payload.
  ///
  /// @code
  /// TypedCallbackAdapter<void(int, int), void(int)> add(hostAdd);
  /// std::future<int> sum = add(1, 2);
  /// @endcode
  template <typename... TArgs, typename... TResults>
  class TypedCallbackAdapter<void(TArgs...), void(TResults...)>
  {
  public:
    using Handler = std::function<void(TResults...)>;
    using Operation = std::function<void(TArgs..., Handler)>;
    using Payload = CompletionPayload_t<TResults...>;

  private:
    std::shared_ptr<const Operation> m_operation;

  public:
    explicit TypedCallbackAdapter(Operation operation)
      : m_operation(std::make_shared<const Operation>(std::move(operation)))
    {
    }

    std::future<Payload> operator()(TArgs... args) const
    {
      return Invoke(Handler(), std::move(args)...);
    }

    std::future<Payload> operator()(TArgs... args, Handler secondaryCallback) const
    {
      return Invoke(std::move(secondaryCallback), std::move(args)...);
    }

  private:
    std::future<Payload> Invoke(Handler secondaryCallback, TArgs... args) const
    {
      auto settlement = std::make_shared<Detail::Settlement<Payload>>();
      auto future = settlement->GetFuture();

      Handler onDone = [settlement, secondaryCallback = std::move(secondaryCallback)](TResults... results)
      {
        if (secondaryCallback)
        {
          try
          {
            secondaryCallback(results...);
          }
          catch (...)
          {
            settlement->Reject(std::current_exception());
            return;
          }
        }

        std::optional<HostError> error = LastError::Read();
        if (error.has_value())
        {
          settlement->Reject(std::make_exception_ptr(HostErrorException(std::move(*error))));
        }
        else if constexpr (sizeof...(TResults) == 0)
        {
          settlement->Resolve();
        }
        else
        {
          settlement->Resolve(Payload(std::forward<TResults>(results)...));
        }
      };

      try
      {
        (*m_operation)(std::move(args)..., std::move(onDone));
      }
      catch (...)
      {
        settlement->Reject(std::current_exception());
      }
      return future;
    }
  };

  /// @brief Creates a TypedCallbackAdapter, e.g. PromisifyTyped<void(std::string), void(int, bool)>(op).
  template <typename TSignature, typename TCompletion, typename TOperation>
  TypedCallbackAdapter<TSignature, TCompletion> PromisifyTyped(TOperation&& operation)
  {
    return TypedCallbackAdapter<TSignature, TCompletion>(
      typename TypedCallbackAdapter<TSignature, TCompletion>::Operation(std::forward<TOperation>(operation)));
  }
}

#endif
