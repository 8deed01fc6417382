/**
 * @file errors.hpp
 * @brief Иерархия исключений конвейера
 *
 * Численные особенности (NaN, ±inf, отсутствие сходимости) ошибками
 * не являются и записываются в таблицу как результат.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace conic::model {

/**
 * @brief Базовая ошибка conic
 */
class ConicError : public std::runtime_error {
public:
    explicit ConicError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Ошибка ввода-вывода (файл недоступен для чтения или записи)
 */
class IoError : public ConicError {
public:
    explicit IoError(const std::string& message)
        : ConicError(message) {}
};

/**
 * @brief Ошибка схемы: отсутствуют обязательные колонки
 *
 * Содержит полный список отсутствующих колонок, а не только первую.
 */
class SchemaError : public ConicError {
public:
    explicit SchemaError(const std::string& message,
                         std::vector<std::string> missing_columns = {})
        : ConicError(message)
        , missing_columns_(std::move(missing_columns)) {}

    [[nodiscard]] const std::vector<std::string>& missingColumns() const noexcept {
        return missing_columns_;
    }

private:
    std::vector<std::string> missing_columns_;
};

/**
 * @brief Ошибка разбора ячейки входной таблицы
 */
class ParseError : public SchemaError {
public:
    ParseError(const std::string& message, size_t line = 0, std::string column = {})
        : SchemaError(message)
        , line_(line)
        , column_(std::move(column)) {}

    /// Номер строки файла (с 1), 0 если неизвестен
    [[nodiscard]] size_t line() const noexcept { return line_; }

    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    size_t line_;
    std::string column_;
};

/**
 * @brief Некорректные данные: пустая таблица, недостаточно строк и т.п.
 */
class InvalidDataError : public ConicError {
public:
    explicit InvalidDataError(const std::string& message)
        : ConicError(message) {}
};

/**
 * @brief Некорректная конфигурация (фатальна до начала расчёта)
 */
class ConfigError : public InvalidDataError {
public:
    explicit ConfigError(const std::string& message)
        : InvalidDataError(message) {}
};

} // namespace conic::model
