#pragma once

#include <chrono>
#include <cstddef>

#ifndef CONFIGDESK_VERSION
#define CONFIGDESK_VERSION "0.0.0"
#endif

#ifndef CONFIGDESK_UPDATE_ENDPOINTS
#define CONFIGDESK_UPDATE_ENDPOINTS ""
#endif

namespace configdesk {

inline constexpr const char* APP_NAME = "configdesk";
inline constexpr const char* APP_DISPLAY_NAME = "Claude Config";
inline constexpr const char* APP_VERSION = CONFIGDESK_VERSION;

// The UI server always binds this port in foreground mode.
inline constexpr int SERVER_PORT = 3333;

// Let the UI settle before hitting the network.
inline constexpr std::chrono::seconds UPDATE_CHECK_DELAY{3};

// Characters of release notes shown in the update prompt.
inline constexpr std::size_t RELEASE_NOTES_PREVIEW_CHARS = 200;

} // namespace configdesk
