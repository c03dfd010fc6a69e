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
#include <CallbackBridge/Host/HostError.hpp>
#include <CallbackBridge/Host/HostFuture.hpp>
#include <CallbackBridge/Host/HostObject.hpp>
#include <CallbackBridge/Host/PostedHostFunction.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/version.hpp>
#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <map>
#include <memory>
#include <string>

using namespace CallbackBridge;

namespace
{
  // A small stand-in for a browser extension host: a tabs namespace and two storage areas
  std::shared_ptr<HostObject> CreateDemoHost(boost::asio::any_io_executor executor, std::shared_ptr<std::map<std::string, HostValue>> storage)
  {
    auto root = std::make_shared<HostObject>();

    auto tabs = std::make_shared<HostObject>();
    tabs->Set("query", MakePostedHostFunction(executor,
                                              [](const HostArgs&)
                                              {
                                                return HostCompletion{{HostValue(HostValue::List{"tab-1", "tab-2"})}, std::nullopt};
                                              }));
    tabs->Set("get", MakePostedHostFunction(executor,
                                            [](const HostArgs& args)
                                            {
                                              if (args.empty() || args.front().Kind() != HostValueKind::Integer || args.front().AsInteger() < 0)
                                              {
                                                return HostCompletion{{}, HostError("No tab with the given id")};
                                              }
                                              return HostCompletion{{HostValue(fmt::format("tab-{}", args.front().AsInteger()))}, std::nullopt};
                                            }));
    root->Set("tabs", tabs);

    // Storage areas expose the same host functions as own members
    auto storageArea = std::make_shared<HostObject>();
    storageArea->Set("get", MakePostedHostFunction(executor,
                                                   [storage](const HostArgs& args)
                                                   {
                                                     auto itr = args.empty() ? storage->end() : storage->find(args.front().AsString());
                                                     return HostCompletion{{itr != storage->end() ? itr->second : HostValue()}, std::nullopt};
                                                   }));
    storageArea->Set("set", MakePostedHostFunction(executor,
                                                   [storage](const HostArgs& args)
                                                   {
                                                     (*storage)[args.at(0).AsString()] = args.at(1);
                                                     return HostCompletion{};
                                                   }));

    auto storageNamespace = std::make_shared<HostObject>();
    for (const char* areaName : {"sync", "local"})
    {
      auto area = std::make_shared<HostObject>();
      area->Set("get", storageArea->Get("get"));
      area->Set("set", storageArea->Get("set"));
      storageNamespace->Set(areaName, area);
    }
    root->Set("storage", storageNamespace);
    return root;
  }

  void LogOutcome(const std::string& label, const HostValue& value)
  {
    const HostFuture& future = AsHostFuture(value);
    try
    {
      spdlog::info("{} resolved with {}", label, future.Get().ToString());
    }
    catch (const std::exception& ex)
    {
      spdlog::info("{} rejected: {}", label, ex.what());
    }
  }
}

int main()
{
  spdlog::init_thread_pool(8192, 1);
  auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto async_logger =
    std::make_shared<spdlog::async_logger>("async_logger", stdout_sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  async_logger->set_pattern("[thread %t] %v");
  spdlog::set_default_logger(async_logger);
  spdlog::set_level(spdlog::level::info);
  spdlog::flush_on(spdlog::level::info);

  spdlog::info("=== CallbackBridge demo ===");
  spdlog::info("Boost version: {}.{}.{}", BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000, BOOST_VERSION % 100);

  boost::asio::io_context hostContext;
  auto storage = std::make_shared<std::map<std::string, HostValue>>();
  auto root = CreateDemoHost(hostContext.get_executor(), storage);

  const CatalogBindResult bindResult = ApplyCatalog(root, ExtensionApiCatalog());
  spdlog::info("Catalog applied: {} namespaces bound, {} missing", bindResult.BoundNamespaces, bindResult.SkippedNamespaces);

  const auto tabs = root->Get("tabs").AsObject();
  const auto local = ResolvePath(root, "storage.local");

  HostValue query = tabs->Call("query", {HostValue(HostValue::List{})});
  HostValue found = tabs->Call("get", {HostValue(7)});
  HostValue missing = tabs->Call("get", {HostValue(-1)});
  HostValue stored = local->Call("set", {HostValue("theme"), HostValue("dark")});

  hostContext.run();
  hostContext.restart();

  HostValue readBack = local->Call("get", {HostValue("theme")});
  hostContext.run();

  LogOutcome("tabs.query", query);
  LogOutcome("tabs.get(7)", found);
  LogOutcome("tabs.get(-1)", missing);
  LogOutcome("storage.local.set", stored);
  LogOutcome("storage.local.get", readBack);

  spdlog::shutdown();
  return 0;
}
