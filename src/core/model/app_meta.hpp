#pragma once

#include <cstdint>
#include <string_view>

#ifndef REGEN_APP_VERSION
#define REGEN_APP_VERSION "0.3.0"
#endif

#ifndef REGEN_BUILD_RELEASE
#define REGEN_BUILD_RELEASE "Core Phase 1"
#endif

#ifndef REGEN_AUTHOR_LIST
#define REGEN_AUTHOR_LIST "regen-core contributors"
#endif

namespace regen {

inline constexpr std::string_view kAppDisplayName = "Regen::Regeneration Credit Core";
inline constexpr std::string_view kCurrencyName = "Regeneration Credit";
inline constexpr std::string_view kCurrencySymbol = "RC";
inline constexpr std::string_view kPoolAddressPrefix = "pool:";
inline constexpr std::string_view kAppVersion = REGEN_APP_VERSION;
inline constexpr std::string_view kBuildRelease = REGEN_BUILD_RELEASE;
inline constexpr std::string_view kAuthorList = REGEN_AUTHOR_LIST;

}  // namespace regen
