#pragma once

namespace comicinfo {

constexpr const char* kVersion = "2.0.0";

} // namespace comicinfo
