/**
 * @file ConfigStore.cpp
 * @brief Validated persistence of the server settings
 *
 * (c) 2026 TransEase Project
 * Licensed under MIT License
 */

#include "transease/ConfigStore.h"
#include "transease/AppPaths.h"
#include "transease/Debug.h"
#include "transease/EncodingAdapter.h"
#include "transease/ErrorCodes.h"
#include "transease/Errors.h"
#include "transease/config.h"
#include <QFile>
#include <QSaveFile>
#include <QString>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <mutex>
#include <system_error>

namespace TransEase {

// ========================================================================
// Anonymous namespace: value parsing helpers
// ========================================================================

namespace {

enum class ValueKind { Integer, Boolean, String };

struct SchemaKey {
    const char* key;
    ValueKind kind;
};

const SchemaKey kGeneralSchema[] = {
    { KEY_PORT,            ValueKind::Integer },
    { KEY_ROOT_PATH,       ValueKind::String  },
    { KEY_MAX_CONNECTIONS, ValueKind::Integer },
    { KEY_TIMEOUT,         ValueKind::Integer },
    { KEY_ENCODING,        ValueKind::String  },
    { KEY_LOG_LEVEL,       ValueKind::String  },
    { KEY_SAVE_LOG,        ValueKind::Boolean },
};

bool isRecognized(const std::string& section, const std::string& key) {
    if (section != SECTION_GENERAL) {
        return false;
    }
    return std::any_of(std::begin(kGeneralSchema), std::end(kGeneralSchema),
                       [&key](const SchemaKey& k) { return key == k.key; });
}

std::string trimLower(const std::string& in) {
    size_t begin = 0;
    size_t end = in.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(in[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;

    std::string out = in.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool parseIntValue(const json& value, int& out) {
    if (value.is_number_integer()) {
        const int64_t v = value.get<int64_t>();
        if (v < INT_MIN || v > INT_MAX) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    }

    if (value.is_string()) {
        const std::string s = trimLower(value.get<std::string>());
        if (s.empty()) {
            return false;
        }
        errno = 0;
        char* endPtr = nullptr;
        const long long v = std::strtoll(s.c_str(), &endPtr, 10);
        if (errno != 0 || endPtr == s.c_str() || *endPtr != '\0' || v < INT_MIN || v > INT_MAX) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    }

    return false;
}

bool parseBoolValue(const json& value, bool& out) {
    if (value.is_boolean()) {
        out = value.get<bool>();
        return true;
    }

    if (value.is_number_integer()) {
        const int64_t v = value.get<int64_t>();
        if (v == 0 || v == 1) {
            out = (v == 1);
            return true;
        }
        return false;
    }

    if (value.is_string()) {
        const std::string s = trimLower(value.get<std::string>());
        if (s == "true" || s == "1" || s == "yes" || s == "on") {
            out = true;
            return true;
        }
        if (s == "false" || s == "0" || s == "no" || s == "off") {
            out = false;
            return true;
        }
    }

    return false;
}

bool renderStringValue(const json& value, std::string& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
        return true;
    }
    if (value.is_number() || value.is_boolean()) {
        out = value.dump();
        return true;
    }
    return false;
}

/**
 * @brief Check one recognized general value and convert it to its stored form
 * @param key Recognized key
 * @param value Value as given (typed or string)
 * @param out Stored form (schema type, canonical spelling)
 * @param errorMsg Reason when returning false
 *
 * root_path is only normalized here; directory creation is a separate step.
 */
bool normalizeGeneralValue(const std::string& key, const json& value,
                           json& out, std::string& errorMsg) {
    if (key == KEY_PORT) {
        int port = 0;
        if (!parseIntValue(value, port)) {
            errorMsg = "port must be an integer, got " + value.dump();
            return false;
        }
        if (port < MIN_PORT || port > MAX_PORT) {
            errorMsg = "port must be in range 1-65535, got " + std::to_string(port);
            return false;
        }
        out = port;
        return true;
    }

    if (key == KEY_MAX_CONNECTIONS || key == KEY_TIMEOUT) {
        int v = 0;
        if (!parseIntValue(value, v)) {
            errorMsg = key + " must be an integer, got " + value.dump();
            return false;
        }
        if (v < 1) {
            errorMsg = key + " must be at least 1, got " + std::to_string(v);
            return false;
        }
        out = v;
        return true;
    }

    if (key == KEY_SAVE_LOG) {
        bool b = false;
        if (!parseBoolValue(value, b)) {
            errorMsg = "save_log must be a boolean, got " + value.dump();
            return false;
        }
        out = b;
        return true;
    }

    std::string text;
    if (!renderStringValue(value, text)) {
        errorMsg = key + " must be a string, got " + value.dump();
        return false;
    }

    if (key == KEY_ENCODING) {
        const std::string canonical = EncodingAdapter::canonicalEncodingName(text);
        if (canonical.empty()) {
            errorMsg = "unsupported encoding '" + text + "' (expected gb18030, utf-8 or latin1)";
            return false;
        }
        out = canonical;
        return true;
    }

    if (key == KEY_LOG_LEVEL) {
        LogLevel level = LogLevel::Info;
        if (!parseLogLevel(text, level)) {
            errorMsg = "log_level must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL, got '" + text + "'";
            return false;
        }
        out = logLevelToString(level);
        return true;
    }

    if (key == KEY_ROOT_PATH) {
        if (text.empty()) {
            errorMsg = "root_path must not be empty";
            return false;
        }
        out = AppPaths::normalize(std::filesystem::u8path(text)).u8string();
        return true;
    }

    errorMsg = "unrecognized key " + key;
    return false;
}

/**
 * @brief Create a directory if missing and confirm it is a directory
 */
bool ensureDirectory(const std::filesystem::path& dir, std::string& errorMsg) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        errorMsg = ec.message();
        return false;
    }

    if (!std::filesystem::is_directory(dir, ec)) {
        errorMsg = "not a directory";
        return false;
    }
    return true;
}

const json* findValue(const json& doc, const std::string& section, const std::string& key) {
    auto sectionIt = doc.find(section);
    if (sectionIt == doc.end() || !sectionIt->is_object()) {
        return nullptr;
    }
    auto keyIt = sectionIt->find(key);
    if (keyIt == sectionIt->end()) {
        return nullptr;
    }
    return &(*keyIt);
}

} // anonymous namespace

// ========================================================================
// Constructor
// ========================================================================

ConfigStore::ConfigStore(const std::filesystem::path& configPath)
    : m_path(AppPaths::normalize(configPath))
    , m_defaults()
    , m_document()
    , m_loaded(false)
{
    json general;
    general[KEY_PORT] = DEFAULT_PORT;
    general[KEY_ROOT_PATH] = AppPaths::workingDirectory().u8string();
    general[KEY_MAX_CONNECTIONS] = DEFAULT_MAX_CONNECTIONS;
    general[KEY_TIMEOUT] = DEFAULT_TIMEOUT_S;
    general[KEY_ENCODING] = DEFAULT_ENCODING;
    general[KEY_LOG_LEVEL] = DEFAULT_LOG_LEVEL;
    general[KEY_SAVE_LOG] = DEFAULT_SAVE_LOG;

    m_defaults = json::object();
    m_defaults[SECTION_GENERAL] = general;
    m_document = m_defaults;
}

// ========================================================================
// Load
// ========================================================================

ServerSettings ConfigStore::load() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return loadLocked();
}

ServerSettings ConfigStore::loadLocked() {
    bool repaired = false;
    json doc = readDocumentLocked(repaired);

    if (repairGeneralLocked(doc)) {
        repaired = true;
    }
    ensureRootPathLocked(doc, repaired);

    if (repaired) {
        std::string errorMsg;
        if (!writeDocument(doc, errorMsg)) {
            LOG_ERROR(ErrorCodes::CONFIG_WRITE_FAILED << " Cannot write repaired configuration '"
                      << m_path.u8string() << "': " << errorMsg);
        }
    }

    m_document = std::move(doc);
    m_loaded = true;
    return snapshotLocked();
}

json ConfigStore::readDocumentLocked(bool& repaired) const {
    const QString qPath = QString::fromStdString(m_path.u8string());
    QFile configFile(qPath);

    if (!configFile.exists()) {
        // First run - defaults are written before anything is read.
        std::string errorMsg;
        if (writeDocument(m_defaults, errorMsg)) {
            LOG_INFO("Created default configuration at " << m_path.u8string());
        } else {
            LOG_ERROR(ErrorCodes::CONFIG_WRITE_FAILED << " Cannot create configuration '"
                      << m_path.u8string() << "': " << errorMsg);
        }
        return m_defaults;
    }

    if (!configFile.open(QIODevice::ReadOnly)) {
        LOG_ERROR(ErrorCodes::CONFIG_CORRUPT << " Cannot read configuration '"
                  << m_path.u8string() << "': " << configFile.errorString().toStdString()
                  << "; using defaults");
        repaired = true;
        return m_defaults;
    }

    const QByteArray data = configFile.readAll();
    configFile.close();

    json doc = json::parse(data.constData(), data.constData() + data.size(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        LOG_WARNING(ErrorCodes::CONFIG_CORRUPT << " Configuration '" << m_path.u8string()
                    << "' is malformed; replacing it with defaults");
        repaired = true;
        return m_defaults;
    }

    return doc;
}

bool ConfigStore::repairGeneralLocked(json& doc) const {
    bool repaired = false;

    auto sectionIt = doc.find(SECTION_GENERAL);
    if (sectionIt == doc.end() || !sectionIt->is_object()) {
        if (sectionIt != doc.end()) {
            LOG_WARNING(ErrorCodes::CONFIG_CORRUPT << " Section 'general' is not an object; using defaults");
        }
        doc[SECTION_GENERAL] = m_defaults[SECTION_GENERAL];
        return true;
    }

    json& general = *sectionIt;
    const json& defaults = m_defaults[SECTION_GENERAL];

    for (const SchemaKey& schemaKey : kGeneralSchema) {
        const std::string key = schemaKey.key;

        if (!general.contains(key)) {
            general[key] = defaults[key];
            repaired = true;
            continue;
        }

        json normalized;
        std::string errorMsg;
        if (!normalizeGeneralValue(key, general[key], normalized, errorMsg)) {
            LOG_WARNING(ErrorCodes::CONFIG_CORRUPT << " Invalid general." << key << " ("
                        << errorMsg << "); using default " << defaults[key].dump());
            general[key] = defaults[key];
            repaired = true;
        } else if (normalized != general[key]) {
            general[key] = normalized;
            repaired = true;
        }
    }

    return repaired;
}

void ConfigStore::ensureRootPathLocked(json& doc, bool& repaired) const {
    json& general = doc[SECTION_GENERAL];
    const std::filesystem::path rootPath =
        std::filesystem::u8path(general[KEY_ROOT_PATH].get<std::string>());

    std::string errorMsg;
    if (ensureDirectory(rootPath, errorMsg)) {
        return;
    }

    LOG_ERROR(ErrorCodes::CONFIG_ROOT_UNAVAILABLE << " Cannot create root directory '"
              << rootPath.u8string() << "': " << errorMsg);

    // Fall back to the working directory and remember the substitution.
    const std::filesystem::path fallback = AppPaths::workingDirectory();
    std::string fallbackError;
    if (!ensureDirectory(fallback, fallbackError)) {
        LOG_ERROR(ErrorCodes::CONFIG_ROOT_UNAVAILABLE << " Working directory '"
                  << fallback.u8string() << "' is unavailable: " << fallbackError);
    }
    general[KEY_ROOT_PATH] = fallback.u8string();
    repaired = true;
}

// ========================================================================
// Save
// ========================================================================

bool ConfigStore::save(const SettingsUpdate& settings) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (!m_loaded) {
        loadLocked();
    }

    try {
        json candidate = m_document;

        for (const auto& sectionPair : settings) {
            const std::string& section = sectionPair.first;
            if (!candidate.contains(section) || !candidate[section].is_object()) {
                candidate[section] = json::object();
            }

            for (const auto& option : sectionPair.second) {
                const std::string& key = option.first;
                if (!isRecognized(section, key)) {
                    // Forward compatibility: unknown keys are stored as given.
                    candidate[section][key] = option.second;
                    continue;
                }

                json normalized;
                std::string errorMsg;
                if (!normalizeGeneralValue(key, option.second, normalized, errorMsg)) {
                    throw ConfigValidationError(errorMsg);
                }
                candidate[section][key] = normalized;
            }
        }

        // The committed document must satisfy the full schema, not just the touched keys.
        json& general = candidate[SECTION_GENERAL];
        for (const SchemaKey& schemaKey : kGeneralSchema) {
            json normalized;
            std::string errorMsg;
            if (!general.contains(schemaKey.key) ||
                !normalizeGeneralValue(schemaKey.key, general[schemaKey.key], normalized, errorMsg)) {
                throw ConfigValidationError(errorMsg.empty()
                    ? std::string("missing general.") + schemaKey.key
                    : errorMsg);
            }
            general[schemaKey.key] = normalized;
        }

        const std::filesystem::path rootPath =
            std::filesystem::u8path(general[KEY_ROOT_PATH].get<std::string>());
        std::string dirError;
        if (!ensureDirectory(rootPath, dirError)) {
            throw ConfigValidationError("cannot create root directory '" +
                                        rootPath.u8string() + "': " + dirError);
        }

        std::string writeError;
        if (!writeDocument(candidate, writeError)) {
            LOG_ERROR(ErrorCodes::CONFIG_WRITE_FAILED << " Failed to save configuration: " << writeError);
            return false;
        }

        m_document = std::move(candidate);
        LOG_INFO("Configuration saved to " << m_path.u8string());
        return true;

    } catch (const ConfigValidationError& e) {
        LOG_ERROR(ErrorCodes::CONFIG_INVALID_VALUE << " Failed to save configuration: " << e.what());
        return false;
    } catch (const json::exception& e) {
        LOG_ERROR(ErrorCodes::CONFIG_INVALID_VALUE << " Failed to save configuration: " << e.what());
        return false;
    }
}

bool ConfigStore::writeDocument(const json& doc, std::string& errorMsg) const {
    errorMsg.clear();

    std::error_code ec;
    const auto dir = m_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            errorMsg = "cannot create directory: " + ec.message();
            return false;
        }
    }

    const std::string content = doc.dump(4) + "\n";

    // QSaveFile writes to a temp file in the destination directory and commits via rename.
    QSaveFile out(QString::fromStdString(m_path.u8string()));
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        errorMsg = out.errorString().toStdString();
        return false;
    }

    const qint64 bytesWritten = out.write(content.data(), static_cast<qint64>(content.size()));
    if (bytesWritten != static_cast<qint64>(content.size())) {
        errorMsg = out.errorString().toStdString();
        out.cancelWriting();
        return false;
    }

    if (!out.commit()) {
        errorMsg = out.errorString().toStdString();
        return false;
    }

    return true;
}

// ========================================================================
// Accessors
// ========================================================================

json ConfigStore::get(const std::string& section, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return lookupLocked(section, key);
}

json ConfigStore::lookupLocked(const std::string& section, const std::string& key) const {
    if (const json* value = findValue(m_document, section, key)) {
        return *value;
    }
    if (const json* value = findValue(m_defaults, section, key)) {
        return *value;
    }
    return nullptr;
}

int ConfigStore::getInt(const std::string& section, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    int out = 0;
    if (const json* value = findValue(m_document, section, key)) {
        if (parseIntValue(*value, out)) {
            return out;
        }
    }
    if (const json* value = findValue(m_defaults, section, key)) {
        if (parseIntValue(*value, out)) {
            return out;
        }
    }
    return 0;
}

bool ConfigStore::getBool(const std::string& section, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    bool out = false;
    if (const json* value = findValue(m_document, section, key)) {
        if (parseBoolValue(*value, out)) {
            return out;
        }
    }
    if (const json* value = findValue(m_defaults, section, key)) {
        if (parseBoolValue(*value, out)) {
            return out;
        }
    }
    return false;
}

std::string ConfigStore::getString(const std::string& section, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::string out;
    if (const json* value = findValue(m_document, section, key)) {
        if (renderStringValue(*value, out)) {
            return out;
        }
    }
    if (const json* value = findValue(m_defaults, section, key)) {
        if (renderStringValue(*value, out)) {
            return out;
        }
    }
    return {};
}

ServerSettings ConfigStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return snapshotLocked();
}

ServerSettings ConfigStore::snapshotLocked() const {
    // Each field goes through the same validation as load(), so a value
    // that went bad in memory still reads back as its default.
    auto field = [this](const char* key) -> json {
        const json& defaults = m_defaults[SECTION_GENERAL];
        const json* value = findValue(m_document, SECTION_GENERAL, key);
        json normalized;
        std::string errorMsg;
        if (value && normalizeGeneralValue(key, *value, normalized, errorMsg)) {
            return normalized;
        }
        return defaults[key];
    };

    ServerSettings s;
    s.port = field(KEY_PORT).get<int>();
    s.rootPath = field(KEY_ROOT_PATH).get<std::string>();
    s.maxConnections = field(KEY_MAX_CONNECTIONS).get<int>();
    s.timeoutSeconds = field(KEY_TIMEOUT).get<int>();
    s.encoding = field(KEY_ENCODING).get<std::string>();
    s.logLevel = field(KEY_LOG_LEVEL).get<std::string>();
    s.saveLog = field(KEY_SAVE_LOG).get<bool>();
    return s;
}

}  // namespace TransEase
