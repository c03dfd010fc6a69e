#ifndef CALLBACK_BRIDGE_BINDER_SELECTIVEBINDER_HPP
#define CALLBACK_BRIDGE_BINDER_SELECTIVEBINDER_HPP
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
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <set>
#include <span>
#include <string>

namespace CallbackBridge
{
  /// @brief Replaces the known callback-convention methods of a host object with their Promisify'd equivalents.
  ///
  /// Only own, enumerable, callable properties named in known are converted. Inherited members, non-callable
  /// values and properties that are not named are left untouched, and members inherited through a prototype keep
  /// their synchronous contract. A null target is skipped.
  ///
  /// Not idempotent: binding the same object twice wraps the already wrapped methods again. Bind each object
  /// at most once.
  /// @param target The host object to modify in place (may be null).
  /// @param known Names of the methods that follow the trailing callback convention.
  /// @return The number of methods that were converted.
  std::size_t BindKnownCallbacks(HostObject* target, const std::set<std::string>& known);

  /// @brief Convenience overload of BindKnownCallbacks that builds the name set.
  std::size_t AddAsyncWrappers(const std::shared_ptr<HostObject>& callbackApi, std::initializer_list<std::string> callbackFunctions);

  /// @brief Applies one method set to a group of structurally identical objects (e.g. every storage area).
  /// Null entries are skipped.
  std::size_t AddAsyncWrappers(std::span<const std::shared_ptr<HostObject>> callbackApis, const std::set<std::string>& callbackFunctions);
}

#endif
