#pragma once

#define CONFLUENCE_VERSION_MAJOR 0
#define CONFLUENCE_VERSION_MINOR 2
#define CONFLUENCE_VERSION_PATCH 0

#define CONFLUENCE_VERSION_CODE \
  ((CONFLUENCE_VERSION_MAJOR << 16) | (CONFLUENCE_VERSION_MINOR << 8) | (CONFLUENCE_VERSION_PATCH))

#define CONFLUENCE_VERSION_STRING "0.2.0"

namespace confluence {
struct version {
  static constexpr int major = CONFLUENCE_VERSION_MAJOR;
  static constexpr int minor = CONFLUENCE_VERSION_MINOR;
  static constexpr int patch = CONFLUENCE_VERSION_PATCH;
  static constexpr const char* string = CONFLUENCE_VERSION_STRING;
};
}
