#pragma once

#include "airsync/airsync.h"

#include <string>

namespace airsync {

/**
 * Routes messages to Config::log_callback, or stderr when none is set.
 */
class Logger {
 public:
  Logger() = default;
  explicit Logger(Config::LogCallback callback);

  void Log(const std::string& message) const;

 private:
  Config::LogCallback callback_;
};

}  // namespace airsync
