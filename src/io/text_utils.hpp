/**
 * @file text_utils.hpp
 * @brief Утилиты для разбора текстовых таблиц (UTF-8)
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace conic::io {

/**
 * @brief Перевод строки в нижний регистр
 *
 * Поддерживаются ASCII, кириллица и греческий алфавит
 * (в заголовках встречаются σv, γ).
 */
[[nodiscard]] std::string utf8ToLower(std::string_view input);

/**
 * @brief Удаление пробельных символов по краям
 */
[[nodiscard]] std::string_view trimView(std::string_view str) noexcept;

/**
 * @brief Удаление UTF-8 BOM в начале строки
 */
[[nodiscard]] std::string_view stripBom(std::string_view str) noexcept;

/**
 * @brief Нормализованное имя колонки для нестрогого сравнения заголовков
 *
 * Нижний регистр, пробелы/дефисы/слэши/скобки схлопываются в '_',
 * крайние разделители удаляются: "Depth (m)" → "depth_m".
 */
[[nodiscard]] std::string normalizeColumnName(std::string_view name);

/**
 * @brief Разбиение строки на ячейки
 *
 * Двойные кавычки группируют текст (разделитель внутри кавычек
 * не учитывается), "" внутри кавычек - литеральная кавычка.
 * Ячейки обрезаются по краям.
 */
[[nodiscard]] std::vector<std::string> splitCells(std::string_view line, char delimiter);

/**
 * @brief Экранирование ячейки для записи в CSV
 *
 * Ячейка заключается в кавычки, если содержит разделитель,
 * кавычку или перевод строки.
 */
[[nodiscard]] std::string quoteCell(std::string_view cell, char delimiter);

} // namespace conic::io
