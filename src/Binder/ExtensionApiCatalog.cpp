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

namespace CallbackBridge
{
  namespace
  {
    BindingCatalog CreateExtensionApiCatalog()
    {
      BindingCatalog catalog;
      auto& entries = catalog.Namespaces;

      entries.emplace_back(std::vector<std::string>{"tabs"},
                           std::vector<std::string>{"get", "getCurrent", "sendMessage", "create", "duplicate", "query", "highlight", "update",
                                                    "move", "reload", "remove", "detectLanguage", "captureVisibleTab", "executeScript",
                                                    "insertCSS", "setZoom", "getZoom", "setZoomSettings", "getZoomSettings", "discard"});

      entries.emplace_back(std::vector<std::string>{"runtime"},
                           std::vector<std::string>{"getBackgroundPage", "openOptionsPage", "setUninstallURL", "requestUpdateCheck",
                                                    "restartAfterDelay", "sendMessage", "sendNativeMessage", "getPlatformInfo",
                                                    "getPackageDirectoryEntry"});

      entries.emplace_back(std::vector<std::string>{"permissions"}, std::vector<std::string>{"getAll", "contains", "request", "remove"});

      entries.emplace_back(std::vector<std::string>{"identity"},
                           std::vector<std::string>{"getAuthToken", "getProfileUserInfo", "removeCachedAuthToken", "launchWebAuthFlow",
                                                    "getRedirectURL"});

      entries.emplace_back(std::vector<std::string>{"bookmarks"},
                           std::vector<std::string>{"get", "getChildren", "getRecent", "getTree", "getSubTree", "search", "create", "move",
                                                    "update", "remove", "removeTree"});

      entries.emplace_back(std::vector<std::string>{"browserAction"},
                           std::vector<std::string>{"getTitle", "setIcon", "getPopup", "getBadgeText", "getBadgeBackgroundColor"});

      entries.emplace_back(std::vector<std::string>{"pageAction"}, std::vector<std::string>{"getTitle", "setIcon", "getPopup"});

      entries.emplace_back(std::vector<std::string>{"browsingData"},
                           std::vector<std::string>{"settings", "remove", "removeAppcache", "removeCache", "removeCookies", "removeDownloads",
                                                    "removeFileSystems", "removeFormData", "removeHistory", "removeIndexedDB",
                                                    "removeLocalStorage", "removePluginData", "removePasswords", "removeWebSQL"});

      entries.emplace_back(std::vector<std::string>{"downloads"},
                           std::vector<std::string>{"download", "search", "pause", "resume", "cancel", "getFileIcon", "erase", "removeFile",
                                                    "acceptDanger"});

      entries.emplace_back(std::vector<std::string>{"history"},
                           std::vector<std::string>{"search", "getVisits", "addUrl", "deleteUrl", "deleteRange", "deleteAll"});

      entries.emplace_back(std::vector<std::string>{"alarms"}, std::vector<std::string>{"get", "getAll", "clear", "clearAll"});

      entries.emplace_back(std::vector<std::string>{"i18n"}, std::vector<std::string>{"getAcceptLanguages", "detectLanguage"});

      entries.emplace_back(std::vector<std::string>{"commands"}, std::vector<std::string>{"getAll"});

      entries.emplace_back(std::vector<std::string>{"contextMenus"}, std::vector<std::string>{"create", "update", "remove", "removeAll"});

      // Mostly deprecated in favour of runtime
      entries.emplace_back(std::vector<std::string>{"extension"},
                           std::vector<std::string>{"isAllowedIncognitoAccess", "isAllowedFileSchemeAccess"});

      entries.emplace_back(std::vector<std::string>{"cookies"},
                           std::vector<std::string>{"get", "getAll", "set", "remove", "getAllCookieStores"});

      entries.emplace_back(std::vector<std::string>{"windows"},
                           std::vector<std::string>{"get", "getCurrent", "getLastFocused", "getAll", "create", "update", "remove"});

      entries.emplace_back(std::vector<std::string>{"debugger"}, std::vector<std::string>{"attach", "detach", "sendCommand", "getTargets"});

      entries.emplace_back(std::vector<std::string>{"desktopCapture"}, std::vector<std::string>{"chooseDesktopMedia"});

      entries.emplace_back(std::vector<std::string>{"topSites"}, std::vector<std::string>{"get"});

      // Storage areas share one method set
      entries.emplace_back(std::vector<std::string>{"storage.sync", "storage.local", "storage.managed"},
                           std::vector<std::string>{"get", "getBytesInUse", "set", "remove", "clear"});

      // Content settings share one method set
      entries.emplace_back(std::vector<std::string>{"contentSettings.cookies", "contentSettings.images", "contentSettings.javascript",
                                                    "contentSettings.location", "contentSettings.plugins", "contentSettings.popups",
                                                    "contentSettings.notifications", "contentSettings.fullscreen", "contentSettings.mouselock",
                                                    "contentSettings.microphone", "contentSettings.camera",
                                                    "contentSettings.unsandboxedPlugins", "contentSettings.automaticDownloads"},
                           std::vector<std::string>{"clear", "get", "set", "getResourceIdentifiers"});

      return catalog;
    }
  }

  const BindingCatalog& ExtensionApiCatalog()
  {
    static const BindingCatalog catalog = CreateExtensionApiCatalog();
    return catalog;
  }
}
