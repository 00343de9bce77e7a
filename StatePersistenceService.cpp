#include "StatePersistenceService.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <uuid/uuid.h>

namespace {

const char* columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

long long parseInteger(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": not a number: '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(key + ": not a number: '" + value + "'");
    }
    return number;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    throw std::invalid_argument(key + ": expected true/false, got '" + value + "'");
}

// Применяет одно значение к настройкам, бросает std::invalid_argument при ошибке
void applySetting(Settings& settings, const std::string& key, const std::string& value) {
    if (key == "version_prefix") {
        settings.versionPrefix = value;
    } else if (key == "version_digits") {
        long long digits = parseInteger(key, value);
        if (digits < 1 || digits > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("version_digits must be >= 1");
        }
        settings.versionDigits = static_cast<int>(digits);
    } else if (key == "start_version") {
        long long start = parseInteger(key, value);
        if (start < 0) {
            throw std::invalid_argument("start_version must be >= 0");
        }
        settings.startVersion = start;
    } else if (key == "archive_destination") {
        settings.archiveDestination = value;
    } else if (key == "versions_to_keep") {
        settings.versionsToKeep = parseInteger(key, value);
    } else if (key == "verify_checksums") {
        settings.verifyChecksums = parseBool(key, value);
    } else {
        throw std::invalid_argument("unknown setting: " + key);
    }
}

std::string generateId() {
    uuid_t uuid;
    uuid_generate(uuid);
    char text[37];
    uuid_unparse_lower(uuid, text);
    return text;
}

} // namespace

StatePersistenceService::StatePersistenceService(const std::string& dbPath) {
    if (sqlite3_open(dbPath.c_str(), &db) != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Could not open database " + dbPath + ": " + message);
    }
}

StatePersistenceService::~StatePersistenceService() {
    if (db) sqlite3_close(db);
}

void StatePersistenceService::initializeSchema() {
    const std::string sql = R"SQL(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS operations (
            id TEXT PRIMARY KEY,
            seq INTEGER NOT NULL,
            timestamp TEXT NOT NULL,
            kind TEXT NOT NULL,
            project_path TEXT,
            outcome TEXT NOT NULL,
            message TEXT
        );
    )SQL";
    execute(sql);
}

void StatePersistenceService::execute(const std::string& sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL error: " + msg);
    }
}

sqlite3_stmt* StatePersistenceService::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SQL prepare error: " + std::string(sqlite3_errmsg(db)));
    }
    return stmt;
}

void StatePersistenceService::stepDone(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQL step error: " + std::string(sqlite3_errmsg(db)));
    }
}

const std::vector<std::string>& StatePersistenceService::settingKeys() {
    static const std::vector<std::string> keys = {
        "version_prefix", "version_digits", "start_version",
        "archive_destination", "versions_to_keep", "verify_checksums"
    };
    return keys;
}

std::optional<std::string> StatePersistenceService::getSetting(const std::string& key) {
    sqlite3_stmt* stmt = prepare("SELECT value FROM settings WHERE key = ?;");
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

void StatePersistenceService::setSetting(const std::string& key, const std::string& value) {
    Settings probe;
    applySetting(probe, key, value); // проверка ключа и значения

    sqlite3_stmt* stmt = prepare("INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);");
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    stepDone(stmt);
}

std::vector<std::pair<std::string, std::string>> StatePersistenceService::listSettings() {
    std::vector<std::pair<std::string, std::string>> values;
    sqlite3_stmt* stmt = prepare("SELECT key, value FROM settings ORDER BY key;");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        values.emplace_back(columnText(stmt, 0), columnText(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return values;
}

Settings StatePersistenceService::applyTo(const Settings& base) {
    Settings settings = base;
    for (const auto& [key, value] : listSettings()) {
        try {
            applySetting(settings, key, value);
        } catch (const std::invalid_argument& ex) {
            std::cerr << "  ⚠ Ignoring stored setting: " << ex.what() << std::endl;
        }
    }
    return settings;
}

std::string StatePersistenceService::recordOperation(OperationRecord record) {
    if (record.id.empty()) {
        record.id = generateId();
    }
    if (record.timestamp == std::chrono::system_clock::time_point()) {
        record.timestamp = std::chrono::system_clock::now();
    }

    const std::string sql =
        "INSERT INTO operations (id, seq, timestamp, kind, project_path, outcome, message) "
        "VALUES (?, (SELECT COALESCE(MAX(seq), 0) + 1 FROM operations), ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = prepare(sql);
    std::string ts = toIsoString(record.timestamp);
    sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.projectPath.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, record.outcome.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.message.c_str(), -1, SQLITE_TRANSIENT);
    stepDone(stmt);

    return record.id;
}

std::vector<OperationRecord> StatePersistenceService::recentOperations(int limit) {
    std::vector<OperationRecord> records;
    sqlite3_stmt* stmt = prepare(
        "SELECT id, timestamp, kind, project_path, outcome, message FROM operations ORDER BY seq DESC LIMIT ?;");
    sqlite3_bind_int(stmt, 1, std::max(limit, 0));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        OperationRecord record;
        record.id = columnText(stmt, 0);
        record.timestamp = fromIsoString(columnText(stmt, 1));
        record.kind = columnText(stmt, 2);
        record.projectPath = columnText(stmt, 3);
        record.outcome = columnText(stmt, 4);
        record.message = columnText(stmt, 5);
        records.push_back(record);
    }
    sqlite3_finalize(stmt);
    return records;
}

std::string StatePersistenceService::toIsoString(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

std::chrono::system_clock::time_point StatePersistenceService::fromIsoString(const std::string& str) {
    std::tm tm{};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}
