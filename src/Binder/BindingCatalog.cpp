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

#include <CallbackBridge/Binder/BindingCatalog.hpp>
#include <CallbackBridge/Binder/SelectiveBinder.hpp>
#include <CallbackBridge/Log/Logger.hpp>
#include <set>

namespace CallbackBridge
{
  namespace
  {
    CALLBACK_BRIDGE_LOGGER_NAME(BindingCatalog);
  }

  CatalogBindResult ApplyCatalog(const std::shared_ptr<HostObject>& root, const BindingCatalog& catalog)
  {
    CatalogBindResult result;
    if (!root)
    {
      return result;
    }

    const auto logger = Log::GetLogger<LoggerName_BindingCatalog>();
    for (const auto& binding : catalog.Namespaces)
    {
      // The known set is built fresh for every entry and dropped afterwards
      const std::set<std::string> known(binding.Methods.begin(), binding.Methods.end());
      for (const auto& path : binding.Paths)
      {
        auto target = ResolvePath(root, path);
        if (!target)
        {
          logger->debug("ApplyCatalog: namespace '{}' is not available, skipping", path);
          ++result.SkippedNamespaces;
          continue;
        }

        const std::size_t converted = BindKnownCallbacks(target.get(), known);
        logger->debug("ApplyCatalog: converted {} of {} methods in '{}'", converted, known.size(), path);
        ++result.BoundNamespaces;
        result.ConvertedMethods += converted;
      }
    }

    logger->info("ApplyCatalog: bound {} namespaces ({} skipped), converted {} methods", result.BoundNamespaces, result.SkippedNamespaces,
                 result.ConvertedMethods);
    return result;
  }
}
