#pragma once

#include <string>
#include <stdexcept>

namespace bank::domain {

/**
 * @brief Уровень изоляции транзакции
 *
 * По умолчанию используется стандартный уровень PostgreSQL - READ COMMITTED.
 */
enum class IsolationLevel {
    READ_COMMITTED,
    REPEATABLE_READ,
    SERIALIZABLE
};

inline std::string toString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::READ_COMMITTED:  return "READ_COMMITTED";
        case IsolationLevel::REPEATABLE_READ: return "REPEATABLE_READ";
        case IsolationLevel::SERIALIZABLE:    return "SERIALIZABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief SQL-форма для SET TRANSACTION ISOLATION LEVEL
 */
inline std::string toSql(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::READ_COMMITTED:  return "READ COMMITTED";
        case IsolationLevel::REPEATABLE_READ: return "REPEATABLE READ";
        case IsolationLevel::SERIALIZABLE:    return "SERIALIZABLE";
    }
    throw std::invalid_argument("Unknown isolation level");
}

/**
 * @brief Преобразовать строку в IsolationLevel
 * @throws std::invalid_argument если строка не распознана
 */
inline IsolationLevel parseIsolationLevel(const std::string& str) {
    if (str == "READ_COMMITTED" || str == "read_committed" || str == "READ COMMITTED")
        return IsolationLevel::READ_COMMITTED;
    if (str == "REPEATABLE_READ" || str == "repeatable_read" || str == "REPEATABLE READ")
        return IsolationLevel::REPEATABLE_READ;
    if (str == "SERIALIZABLE" || str == "serializable")
        return IsolationLevel::SERIALIZABLE;
    throw std::invalid_argument("Unknown isolation level: " + str);
}

} // namespace bank::domain
