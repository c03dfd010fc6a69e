#ifndef CALLBACK_BRIDGE_ADAPTER_PROMISIFY_HPP
#define CALLBACK_BRIDGE_ADAPTER_PROMISIFY_HPP
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
#include <CallbackBridge/Host/HostValue.hpp>

namespace CallbackBridge
{
  /// @brief Collapses the values a completion callback was invoked with into a single value.
  ///
  /// No values gives Undefined, a single value is returned as is, and several values become a List in
  /// invocation order.
  HostValue NormalizeCompletionPayload(HostArgs results);

  /// @brief Wraps a callback-convention host function so that it returns a future.
  ///
  /// The wrapped function follows the pattern f(arg1, ..., argN, completionCallback) and reports failure by
  /// populating LastError before the completion callback runs. The returned function g is called as
  /// g(arg1, ..., argN) or g(arg1, ..., argN, secondaryCallback) and returns a HostValue carrying a HostFuture:
  ///
  /// - A callable last argument is removed and treated as the secondary callback. The host functions are
  ///   variadic, so this is decided from the runtime kind of the argument, not from a declared arity.
  /// - If f throws synchronously the future is rejected with that exception.
  /// - On completion the secondary callback (if any) is invoked with the results first. If it throws the future
  ///   is rejected with that exception and nothing else happens.
  /// - Otherwise LastError is read exactly once. A populated slot rejects with HostErrorException, an empty slot
  ///   resolves with NormalizeCompletionPayload(results).
  ///
  /// The future settles exactly once, later completions are ignored (the secondary callback still runs for
  /// each of them). Nothing is logged, retried or timed out.
  /// @param callbackApi The function to wrap.
  /// @return The future returning equivalent.
  HostFunction Promisify(HostFunction callbackApi);
}

#endif
