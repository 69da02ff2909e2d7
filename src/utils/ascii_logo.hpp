/**
 * @file    ascii_logo.hpp
 * @brief   ASCII art shown by the CLI
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace pwt {

inline constexpr const char* ASCII_BANNER = R"(
  ____  _           _        __        __    _                            _
 |  _ \| |__   ___ | |_ ___  \ \      / /_ _| |_ ___ _ __ _ __ ___   __ _ _ __| | __
 | |_) | '_ \ / _ \| __/ _ \  \ \ /\ / / _` | __/ _ \ '__| '_ ` _ \ / _` | '__| |/ /
 |  __/| | | | (_) | || (_) |  \ V  V / (_| | ||  __/ |  | | | | | | (_| | |  |   <
 |_|   |_| |_|\___/ \__\___/    \_/\_/ \__,_|\__\___|_|  |_| |_| |_|\__,_|_|  |_|\_\
)";

inline constexpr const char* ASCII_COMPACT = R"(
  [ pwt ] Photo Watermark Tool
)";

}  // namespace pwt
