/**
 * @file sounding_table.hpp
 * @brief Таблица данных статического зондирования (CPTu)
 *
 * Колоночное хранение фиксированной схемы (см. Column). Порядок строк -
 * порядок записей в файле, стадии конвейера его сохраняют.
 */

#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace conic::model {

/**
 * @brief Таблица зондирования
 *
 * Стадии конвейера принимают таблицу по const-ссылке и возвращают новую;
 * входная таблица не изменяется.
 */
class SoundingTable {
public:
    SoundingTable() = default;

    /**
     * @brief Количество строк
     */
    [[nodiscard]] size_t rowCount() const noexcept { return row_count_; }

    [[nodiscard]] bool empty() const noexcept { return row_count_ == 0; }

    /**
     * @brief Колонки в порядке создания (включая Convergence)
     */
    [[nodiscard]] const std::vector<Column>& columns() const noexcept { return order_; }

    /**
     * @brief Числовые колонки в порядке создания (без Convergence)
     */
    [[nodiscard]] std::vector<Column> numericColumns() const;

    [[nodiscard]] bool hasColumn(Column column) const noexcept;

    /**
     * @brief Значения числовой колонки
     * @throws SchemaError Если колонки нет в таблице
     */
    [[nodiscard]] const std::vector<double>& values(Column column) const;

    /**
     * @brief Значение ячейки
     * @throws SchemaError Если колонки нет в таблице
     */
    [[nodiscard]] double value(Column column, size_t row) const {
        return values(column).at(row);
    }

    /**
     * @brief Признаки сходимости решателя
     * @throws SchemaError Если колонка ещё не рассчитана
     */
    [[nodiscard]] const std::vector<ConvergenceState>& convergence() const;

    /**
     * @brief Установить (добавить или заменить) числовую колонку
     *
     * Новая колонка добавляется в конец порядка, существующая
     * заменяется на своём месте.
     *
     * @throws InvalidDataError При несовпадении длины или для Column::Convergence
     */
    void setColumn(Column column, std::vector<double> values);

    /**
     * @brief Установить колонку признаков сходимости
     * @throws InvalidDataError При несовпадении длины
     */
    void setConvergence(std::vector<ConvergenceState> states);

    /**
     * @brief Копия таблицы с добавленной/заменённой колонкой
     */
    [[nodiscard]] SoundingTable withColumn(Column column, std::vector<double> values) const;

    [[nodiscard]] SoundingTable withConvergence(std::vector<ConvergenceState> states) const;

    /**
     * @brief Копия таблицы, содержащая только указанные строки (в заданном порядке)
     * @throws std::out_of_range При индексе за пределами таблицы
     */
    [[nodiscard]] SoundingTable selectRows(const std::vector<size_t>& rows) const;

    /**
     * @brief Побитовое совпадение таблиц (NaN == NaN, если биты равны)
     */
    [[nodiscard]] bool identicalTo(const SoundingTable& other) const noexcept;

private:
    void adoptRowCount(size_t size);

    size_t row_count_ = 0;
    std::vector<Column> order_;
    std::array<std::vector<double>, kColumnCount> data_;
    std::vector<ConvergenceState> convergence_;
};

/**
 * @brief Проверить наличие колонок, нужных стадии
 * @throws SchemaError Со списком всех отсутствующих колонок
 */
void requireColumns(
    const SoundingTable& table,
    std::initializer_list<Column> columns,
    std::string_view stage
);

} // namespace conic::model
