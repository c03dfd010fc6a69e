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
#include <CallbackBridge/Host/HostFuture.hpp>
#include <CallbackBridge/Host/HostObject.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>

namespace CallbackBridge
{
  namespace
  {
    // Completes through a trailing callback when there is one, otherwise returns the value directly
    HostFunction CompletesWith(HostValue value)
    {
      return [value](HostArgs args) -> HostValue
      {
        if (args.empty() || !args.back().IsCallable())
        {
          return value;
        }
        args.back()({value});
        return {};
      };
    }

    std::shared_ptr<HostObject> CreateNamespace(std::initializer_list<std::string> methods)
    {
      auto object = std::make_shared<HostObject>();
      for (const auto& method : methods)
      {
        object->Set(method, CompletesWith(HostValue(method)));
      }
      return object;
    }

    const NamespaceBinding* FindBinding(const BindingCatalog& catalog, const std::string& path)
    {
      for (const auto& binding : catalog.Namespaces)
      {
        if (std::find(binding.Paths.begin(), binding.Paths.end(), path) != binding.Paths.end())
        {
          return &binding;
        }
      }
      return nullptr;
    }
  }

  TEST(BindingCatalogTest, MissingNamespaces_AreSkipped)
  {
    auto root = std::make_shared<HostObject>();
    root->Set("tabs", CreateNamespace({"query", "onUpdated"}));

    BindingCatalog catalog;
    catalog.Namespaces.emplace_back(std::vector<std::string>{"tabs"}, std::vector<std::string>{"query"});
    catalog.Namespaces.emplace_back(std::vector<std::string>{"history"}, std::vector<std::string>{"search"});

    const CatalogBindResult result = ApplyCatalog(root, catalog);

    EXPECT_EQ(result.BoundNamespaces, 1u);
    EXPECT_EQ(result.SkippedNamespaces, 1u);
    EXPECT_EQ(result.ConvertedMethods, 1u);

    const auto tabs = root->Get("tabs").AsObject();
    EXPECT_EQ(AsHostFuture(tabs->Call("query", {})).Get(), HostValue("query"));
    EXPECT_FALSE(tabs->Call("onUpdated", {}).IsFuture());
  }

  TEST(BindingCatalogTest, NestedPaths_ShareOneMethodList)
  {
    auto root = std::make_shared<HostObject>();
    auto storage = std::make_shared<HostObject>();
    storage->Set("sync", CreateNamespace({"get", "set"}));
    storage->Set("local", CreateNamespace({"get", "set"}));
    root->Set("storage", storage);

    BindingCatalog catalog;
    catalog.Namespaces.emplace_back(std::vector<std::string>{"storage.sync", "storage.local", "storage.managed"},
                                    std::vector<std::string>{"get", "set"});

    const CatalogBindResult result = ApplyCatalog(root, catalog);

    EXPECT_EQ(result.BoundNamespaces, 2u);
    EXPECT_EQ(result.SkippedNamespaces, 1u);
    EXPECT_EQ(result.ConvertedMethods, 4u);
    EXPECT_EQ(AsHostFuture(ResolvePath(root, "storage.local")->Call("set", {HostValue("k"), HostValue(1)})).Get(), HostValue("set"));
  }

  TEST(BindingCatalogTest, NullRoot_IsNoOp)
  {
    const CatalogBindResult result = ApplyCatalog(nullptr, ExtensionApiCatalog());

    EXPECT_EQ(result.BoundNamespaces, 0u);
    EXPECT_EQ(result.SkippedNamespaces, 0u);
    EXPECT_EQ(result.ConvertedMethods, 0u);
  }

  TEST(BindingCatalogTest, ExtensionApiCatalog_CoversKnownNamespaces)
  {
    const BindingCatalog& catalog = ExtensionApiCatalog();

    const auto* tabs = FindBinding(catalog, "tabs");
    ASSERT_NE(tabs, nullptr);
    EXPECT_EQ(tabs->Methods.size(), 20u);
    EXPECT_NE(std::find(tabs->Methods.begin(), tabs->Methods.end(), "query"), tabs->Methods.end());

    const auto* storage = FindBinding(catalog, "storage.managed");
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(storage->Paths.size(), 3u);
    EXPECT_EQ(storage->Methods, (std::vector<std::string>{"get", "getBytesInUse", "set", "remove", "clear"}));

    const auto* contentSettings = FindBinding(catalog, "contentSettings.camera");
    ASSERT_NE(contentSettings, nullptr);
    EXPECT_EQ(contentSettings->Paths.size(), 13u);

    EXPECT_EQ(FindBinding(catalog, "topSites")->Methods, (std::vector<std::string>{"get"}));
    EXPECT_EQ(FindBinding(catalog, "storage"), nullptr);
  }

  TEST(BindingCatalogTest, ExtensionApiCatalog_AppliedToPartialHost)
  {
    auto root = std::make_shared<HostObject>();
    root->Set("alarms", CreateNamespace({"get", "getAll", "clear", "clearAll", "create"}));
    root->Set("runtime", CreateNamespace({"getPlatformInfo", "getURL"}));
    root->Set("id", HostValue("extension-id"));

    const CatalogBindResult result = ApplyCatalog(root, ExtensionApiCatalog());

    EXPECT_EQ(result.BoundNamespaces, 2u);
    EXPECT_EQ(result.ConvertedMethods, 5u);

    const auto runtime = root->Get("runtime").AsObject();
    EXPECT_TRUE(runtime->Call("getPlatformInfo", {}).IsFuture());
    // Not a callback method, keeps its synchronous contract
    EXPECT_FALSE(runtime->Call("getURL", {}).IsFuture());
    EXPECT_FALSE(root->Get("alarms").AsObject()->Call("create", {}).IsFuture());
  }
}
