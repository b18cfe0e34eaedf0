/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace TransEase {
namespace ErrorCodes {

// Configuration
inline constexpr const char* CONFIG_INVALID_VALUE = "TE-CFG-1000";
inline constexpr const char* CONFIG_ROOT_UNAVAILABLE = "TE-CFG-1001";
inline constexpr const char* CONFIG_WRITE_FAILED = "TE-CFG-1100";
inline constexpr const char* CONFIG_CORRUPT = "TE-CFG-1200";

// Server lifecycle
inline constexpr const char* SERVER_BIND_FAILED = "TE-SRV-2000";
inline constexpr const char* SERVER_BIND_TIMEOUT = "TE-SRV-2001";
inline constexpr const char* SERVER_ROOT_UNAVAILABLE = "TE-SRV-2002";
inline constexpr const char* SERVER_RUNTIME_FAULT = "TE-SRV-2100";
inline constexpr const char* SERVER_STOP_TIMEOUT = "TE-SRV-2200";
inline constexpr const char* SERVER_INTERNAL_ERROR = "TE-SRV-2300";

}  // namespace ErrorCodes
}  // namespace TransEase
