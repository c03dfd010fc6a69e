#ifndef CALLBACK_BRIDGE_BINDER_BINDINGCATALOG_HPP
#define CALLBACK_BRIDGE_BINDER_BINDINGCATALOG_HPP
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
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace CallbackBridge
{
  /// @brief One catalog entry: the namespaces that share a set of callback-convention method names.
  ///
  /// Paths are dot separated and relative to the catalog root ("tabs", "storage.sync"). Several paths can share one
  /// method list, which is how structurally identical sub-objects (storage areas, content settings) are described.
  struct NamespaceBinding
  {
    std::vector<std::string> Paths;
    std::vector<std::string> Methods;

    NamespaceBinding(std::vector<std::string> paths, std::vector<std::string> methods)
      : Paths(std::move(paths))
      , Methods(std::move(methods))
    {
    }
  };

  /// @brief The static list of (namespace, method-name) pairs applied at startup.
  struct BindingCatalog
  {
    std::vector<NamespaceBinding> Namespaces;
  };

  /// @brief Outcome of ApplyCatalog.
  struct CatalogBindResult
  {
    /// @brief Namespace paths that were found and bound.
    std::size_t BoundNamespaces{0};
    /// @brief Namespace paths that do not exist below the root.
    std::size_t SkippedNamespaces{0};
    /// @brief Total number of methods replaced by future returning versions.
    std::size_t ConvertedMethods{0};
  };

  /// @brief Resolves every catalog path below root and runs the selective binder on it.
  ///
  /// Missing namespaces are skipped, so one catalog can be applied to hosts that only expose part of the
  /// surface. The binder is not idempotent, apply a catalog at most once per root.
  /// @param root The host root object (may be null, in which case nothing happens).
  /// @param catalog The namespaces and method names to convert.
  CatalogBindResult ApplyCatalog(const std::shared_ptr<HostObject>& root, const BindingCatalog& catalog);

  /// @brief The default catalog for the browser extension API surface.
  const BindingCatalog& ExtensionApiCatalog();
}

#endif
