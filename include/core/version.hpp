#pragma once

#ifndef TOOLHOST_VERSION
#define TOOLHOST_VERSION "0.1.0"
#endif

namespace toolhost::core {

constexpr const char* kServerName = "toolhost";
constexpr const char* kServerVersion = TOOLHOST_VERSION;

}  // namespace toolhost::core
