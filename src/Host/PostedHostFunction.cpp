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

#include <CallbackBridge/Host/HostValueTypeException.hpp>
#include <CallbackBridge/Host/LastError.hpp>
#include <CallbackBridge/Host/PostedHostFunction.hpp>
#include <boost/asio/post.hpp>
#include <memory>

namespace CallbackBridge
{
  HostFunction MakePostedHostFunction(boost::asio::any_io_executor executor, HostOperationHandler handler)
  {
    auto sharedHandler = std::make_shared<const HostOperationHandler>(std::move(handler));
    return [executor = std::move(executor), sharedHandler](HostArgs args) -> HostValue
    {
      if (args.empty() || !args.back().IsCallable())
      {
        throw HostValueTypeException("Host function called without a trailing completion callback");
      }

      HostValue completionCallback = std::move(args.back());
      args.pop_back();

      boost::asio::post(executor,
                        [sharedHandler, completionCallback = std::move(completionCallback), args = std::move(args)]()
                        {
                          HostCompletion completion = (*sharedHandler)(args);

                          // The error is only visible while the completion callback runs
                          LastErrorScope errorScope(std::move(completion.Error));
                          completionCallback(std::move(completion.Results));
                        });
      return {};
    };
  }
}
