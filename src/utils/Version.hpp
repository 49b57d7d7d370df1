#pragma once

#ifndef TR_BUILD_VERSION
#define TR_BUILD_VERSION "0.0.0"
#endif

namespace tr::version
{

// Compile-time helpers derived from TR_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = TR_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "TinyRemote/" TR_BUILD_VERSION;

} // namespace tr::version
