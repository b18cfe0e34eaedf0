/**
 * @file ConfigStore.h
 * @brief Validated persistence of the server settings
 *
 * Settings are stored as a JSON document of sections, e.g.
 * @code
 * {
 *     "general": {
 *         "port": 21,
 *         "root_path": "/srv/share",
 *         "max_connections": 50,
 *         "timeout": 300,
 *         "encoding": "gb18030",
 *         "log_level": "INFO",
 *         "save_log": false
 *     }
 * }
 * @endcode
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <map>
#include <shared_mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace TransEase {

using json = nlohmann::json;

/**
 * @brief Updates for save(): section -> key -> value
 *
 * Values may be given with their schema type or as strings ("21", "True").
 */
using SettingsUpdate = std::map<std::string, std::map<std::string, json>>;

/**
 * @brief Typed view of the recognized "general" section
 */
struct ServerSettings {
    int port = 0;
    std::string rootPath;
    int maxConnections = 0;
    int timeoutSeconds = 0;
    std::string encoding;
    std::string logLevel;
    bool saveLog = false;
};

/**
 * @class ConfigStore
 * @brief Loads, repairs, validates and atomically saves the settings file
 *
 * Invariants after load() or a successful save():
 * - every recognized key is present with a valid value
 * - root_path is an absolute path to an existing directory
 * - unknown sections and keys are kept verbatim
 *
 * save() is all-or-nothing: on any validation or write failure it returns
 * false and neither the file nor the in-memory document changes.
 *
 * Thread Safety:
 * - save() and load() are exclusive writers
 * - getters and snapshot() take a shared lock, so each call sees either
 *   the document before or after a save, never a mix
 */
class ConfigStore {
public:
    /**
     * @param configPath Settings file; made absolute against the working directory
     */
    explicit ConfigStore(const std::filesystem::path& configPath);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /**
     * @brief Load (or create) the settings file and repair it
     * @return Settings after repair
     *
     * - missing file: defaults are written first
     * - malformed file: replaced with defaults (logged, never fatal)
     * - missing or invalid recognized keys: schema default injected
     * - root_path that cannot be created: working directory substituted
     *
     * Any repair is written back to the file.
     */
    ServerSettings load();

    /**
     * @brief Validate and commit settings updates
     * @return true if the new settings were written
     *
     * root_path values are made absolute and created if missing. The
     * directory is created during validation, so it remains on disk even
     * when the file commit later fails.
     * Errors are logged; nothing is thrown.
     */
    bool save(const SettingsUpdate& settings);

    //=========================================================================
    // Typed accessors
    //=========================================================================

    /**
     * @brief Read an integer setting
     *
     * Falls back to the schema default (0 for unknown keys) if the value is
     * missing or does not parse.
     */
    int getInt(const std::string& section, const std::string& key) const;

    /// Boolean setting; accepts true/false, 1/0, yes/no, on/off. Falls back to the default.
    bool getBool(const std::string& section, const std::string& key) const;

    /// String setting; numbers and booleans are rendered. Falls back to the default.
    std::string getString(const std::string& section, const std::string& key) const;

    /**
     * @brief Raw value as stored, or the schema default, or null
     */
    json get(const std::string& section, const std::string& key) const;

    /**
     * @brief All recognized general settings from one consistent read
     */
    ServerSettings snapshot() const;

    const std::filesystem::path& path() const { return m_path; }

    /**
     * @brief Default document for this store (root_path = working directory at construction)
     */
    const json& defaults() const { return m_defaults; }

private:
    ServerSettings loadLocked();
    json readDocumentLocked(bool& repaired) const;
    bool repairGeneralLocked(json& doc) const;
    void ensureRootPathLocked(json& doc, bool& repaired) const;
    bool writeDocument(const json& doc, std::string& errorMsg) const;
    json lookupLocked(const std::string& section, const std::string& key) const;
    ServerSettings snapshotLocked() const;

    const std::filesystem::path m_path;
    json m_defaults;
    json m_document;
    bool m_loaded;

    mutable std::shared_mutex m_mutex;  ///< Protects m_document
};

}  // namespace TransEase
