// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#include "uamask/util/log.h"

#include <iostream>
#include <mutex>
#include <utility>

namespace uamask {
namespace log {

namespace {

std::mutex& HandlerMutex() {
  static std::mutex mutex;
  return mutex;
}

Handler& CurrentHandler() {
  static Handler handler;
  return handler;
}

}  // namespace

Handler SetHandler(Handler handler) {
  std::lock_guard<std::mutex> lock(HandlerMutex());
  return std::exchange(CurrentHandler(), std::move(handler));
}

void Warn(std::string_view message) {
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(HandlerMutex());
    handler = CurrentHandler();
  }
  if (handler) {
    handler(message);
    return;
  }
  std::cerr << "[uamask] " << message << "\n";
}

}  // namespace log
}  // namespace uamask
