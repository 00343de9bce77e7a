#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

#include "Settings.hpp"

struct OperationRecord {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string kind;        // "snapshot" | "archive"
    std::string projectPath;
    std::string outcome;     // errorCodeName()
    std::string message;
};

// Хранилище настроек (ключ/значение) и журнал операций в SQLite
class StatePersistenceService {
public:
    StatePersistenceService(const std::string& dbPath);
    ~StatePersistenceService();

    StatePersistenceService(const StatePersistenceService&) = delete;
    StatePersistenceService& operator=(const StatePersistenceService&) = delete;

    void initializeSchema(); // Создание таблиц при первом запуске

    static const std::vector<std::string>& settingKeys();

    std::optional<std::string> getSetting(const std::string& key);
    void setSetting(const std::string& key, const std::string& value); // std::invalid_argument на неизвестный ключ/значение
    std::vector<std::pair<std::string, std::string>> listSettings();

    // Сохранённые значения поверх base; некорректные значения пропускаются
    Settings applyTo(const Settings& base);

    std::string recordOperation(OperationRecord record); // возвращает id записи
    std::vector<OperationRecord> recentOperations(int limit);

private:
    std::string toIsoString(const std::chrono::system_clock::time_point& tp);
    std::chrono::system_clock::time_point fromIsoString(const std::string& str);
    void execute(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    void stepDone(sqlite3_stmt* stmt);

    sqlite3* db = nullptr;
};
