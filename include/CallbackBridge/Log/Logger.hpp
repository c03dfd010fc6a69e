#ifndef CALLBACK_BRIDGE_LOG_LOGGER_HPP
#define CALLBACK_BRIDGE_LOG_LOGGER_HPP
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

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace CallbackBridge::Log
{
  /// @brief Gets or creates the named logger, sharing the sinks of the default logger.
  /// @tparam Name A type with a static constexpr std::string_view value, see CALLBACK_BRIDGE_LOGGER_NAME.
  /// @return Shared pointer to the logger.
  template <typename Name>
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = []()
    {
      const std::string name(Name::value);
      auto log = spdlog::get(name);
      if (!log)
      {
        // Inherit the global sink configuration so the application decides where output goes
        log = std::make_shared<spdlog::logger>(name, spdlog::default_logger()->sinks().begin(), spdlog::default_logger()->sinks().end());
        log->set_level(spdlog::default_logger()->level());
        spdlog::register_logger(log);
      }
      return log;
    }();
    return logger;
  }
}

// Declares a compile-time logger name type for CallbackBridge::Log::GetLogger
#define CALLBACK_BRIDGE_LOGGER_NAME(name)            \
  struct LoggerName_##name                           \
  {                                                  \
    static constexpr std::string_view value = #name; \
  }

#endif
