/**
 * @file config.h
 * @brief Compile-time configuration constants for TransEase
 *
 * This file contains the compile-time constants used throughout the
 * TransEase control plane: configuration defaults, lifecycle timeouts,
 * queue bounds and the fixed values handed to the transfer engine.
 *
 * Runtime settings (port, root path, encoding, ...) live in the persisted
 * configuration file managed by ConfigStore. The values here are only the
 * schema defaults and limits for those settings.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * @namespace TransEase
 * @brief TransEase namespace containing all public APIs
 */
namespace TransEase {

//=========================================================================
// Configuration File
//=========================================================================

/** @defgroup ConfigFile Configuration File
 * @brief Location and schema of the persisted settings
 * @{
 */

/**
 * @brief Default configuration file name, relative to the working directory.
 */
constexpr const char* CONFIG_FILE_NAME = "config.json";

/**
 * @brief Environment variable that overrides the configuration file path.
 *
 * Optional. Used by development setups and tests.
 */
constexpr const char* CONFIG_PATH_ENV = "TRANSEASE_CONFIG";

/**
 * @brief Name of the only section with a recognized schema.
 */
constexpr const char* SECTION_GENERAL = "general";

constexpr const char* KEY_PORT = "port";
constexpr const char* KEY_ROOT_PATH = "root_path";
constexpr const char* KEY_MAX_CONNECTIONS = "max_connections";
constexpr const char* KEY_TIMEOUT = "timeout";
constexpr const char* KEY_ENCODING = "encoding";
constexpr const char* KEY_LOG_LEVEL = "log_level";
constexpr const char* KEY_SAVE_LOG = "save_log";

constexpr int DEFAULT_PORT = 21;
constexpr int DEFAULT_MAX_CONNECTIONS = 50;
constexpr int DEFAULT_TIMEOUT_S = 300;
constexpr const char* DEFAULT_ENCODING = "gb18030";
constexpr const char* DEFAULT_LOG_LEVEL = "INFO";
constexpr bool DEFAULT_SAVE_LOG = false;

constexpr int MIN_PORT = 1;
constexpr int MAX_PORT = 65535;

/**
 * @brief Canonical names of the encodings a server may be configured with.
 */
constexpr std::array<const char*, 3> SUPPORTED_ENCODINGS = {
    "gb18030", "utf-8", "latin1"
};

/** @} */ // end of ConfigFile

//=========================================================================
// Server Lifecycle
//=========================================================================

/** @defgroup Lifecycle Server Lifecycle
 * @brief Timing of the supervisor state machine (milliseconds)
 * @{
 */

/**
 * @brief Interface the worker binds on.
 */
constexpr const char* BIND_HOST = "0.0.0.0";

/**
 * @brief Maximum time requestStart() waits for the worker to bind.
 */
constexpr uint32_t BIND_TIMEOUT_MS = 5000;

/**
 * @brief Maximum time requestStop() waits for the worker to terminate.
 *
 * When it elapses the supervisor force-releases the worker and reports
 * the condition as a non-fatal Error event.
 */
constexpr uint32_t STOP_TIMEOUT_MS = 2000;

/**
 * @brief Poll interval of the engine accept loop.
 *
 * closeAll() also wakes the loop directly; this only bounds the latency
 * of noticing a closed listener.
 */
constexpr int ACCEPT_POLL_INTERVAL_MS = 250;

/** @} */ // end of Lifecycle

//=========================================================================
// Transfer Handler
//=========================================================================

/**
 * @brief Permission set granted to the anonymous principal.
 *
 * e=change dir, l=list, r=read, a=append, d=delete, f=rename,
 * m=make dir, w=write, M=change mode.
 */
constexpr const char* ANONYMOUS_PERMISSIONS = "elradfmwM";

/**
 * @brief Name of the anonymous principal.
 */
constexpr const char* ANONYMOUS_USER = "anonymous";

/**
 * @brief Greeting sent to every new control connection.
 */
constexpr const char* BANNER = "220 TransEase server ready.";

/**
 * @brief Maximum length of a single control line (bytes).
 */
constexpr size_t MAX_CONTROL_LINE = 4096;

//=========================================================================
// Event Delivery
//=========================================================================

/**
 * @brief Pending events held per subscriber before LogLine events are dropped.
 */
constexpr size_t EVENT_QUEUE_CAPACITY = 10000;

//=========================================================================
// Logging
//=========================================================================

/**
 * @brief Durable log file name, placed beside the configuration file.
 */
constexpr const char* LOG_FILE_NAME = "transease.log";

/**
 * @brief Size at which the durable log file is rotated (bytes).
 */
constexpr uint64_t LOG_ROTATE_BYTES = 5ull * 1024 * 1024;

/**
 * @brief Observer-side log view bounds.
 *
 * When the displayed log exceeds LOG_VIEW_MAX_LINES it is trimmed to the
 * last LOG_VIEW_KEEP_LINES lines.
 */
constexpr int LOG_VIEW_MAX_LINES = 500;
constexpr int LOG_VIEW_KEEP_LINES = 300;

}  // namespace TransEase
