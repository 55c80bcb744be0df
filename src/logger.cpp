#include "airsync/logger.h"

#include <iostream>
#include <utility>

namespace airsync {

Logger::Logger(Config::LogCallback callback) : callback_(std::move(callback)) {}

void Logger::Log(const std::string& message) const {
  if (callback_) {
    callback_(message);
    return;
  }
  std::cerr << "[airsync] " << message << std::endl;
}

}  // namespace airsync
