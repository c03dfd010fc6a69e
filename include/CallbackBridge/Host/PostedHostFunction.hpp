#ifndef CALLBACK_BRIDGE_HOST_POSTEDHOSTFUNCTION_HPP
#define CALLBACK_BRIDGE_HOST_POSTEDHOSTFUNCTION_HPP
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

#include <CallbackBridge/Host/HostError.hpp>
#include <CallbackBridge/Host/HostValue.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <functional>
#include <optional>
#include <utility>

namespace CallbackBridge
{
  /// @brief What a host operation produced: the values for the completion callback and an optional failure.
  struct HostCompletion
  {
    HostArgs Results;
    std::optional<HostError> Error;
  };

  /// @brief The host side work of an operation, run on the host executor with the leading arguments.
  using HostOperationHandler = std::function<HostCompletion(const HostArgs& args)>;

  /// @brief Builds a callback-convention host function that completes on a host execution context.
  ///
  /// The returned function expects its last argument to be the completion callback. It returns immediately and
  /// posts the work to executor; once handler has run, its error (if any) is published through LastErrorScope for
  /// exactly the duration of the completion callback invocation, the way a host environment reports failures.
  /// @param executor The host execution context.
  /// @param handler Computes the completion of one call.
  /// @throws HostValueTypeException (from the returned function) if the last argument is not callable.
  HostFunction MakePostedHostFunction(boost::asio::any_io_executor executor, HostOperationHandler handler);
}

#endif
