/**
 * @file sounding_table.cpp
 * @brief Реализация таблицы зондирования
 */

#include "sounding_table.hpp"
#include "errors.hpp"
#include <algorithm>
#include <bit>
#include <cstdint>
#include <string>
#include <utility>

namespace conic::model {

std::vector<Column> SoundingTable::numericColumns() const {
    std::vector<Column> result;
    result.reserve(order_.size());
    for (Column column : order_) {
        if (column != Column::Convergence) {
            result.push_back(column);
        }
    }
    return result;
}

bool SoundingTable::hasColumn(Column column) const noexcept {
    return std::find(order_.begin(), order_.end(), column) != order_.end();
}

const std::vector<double>& SoundingTable::values(Column column) const {
    if (column == Column::Convergence || !hasColumn(column)) {
        throw SchemaError(
            "В таблице нет колонки '" + std::string(columnKey(column)) + "'",
            {std::string(columnKey(column))}
        );
    }
    return data_[columnIndex(column)];
}

const std::vector<ConvergenceState>& SoundingTable::convergence() const {
    if (!hasColumn(Column::Convergence)) {
        throw SchemaError(
            "В таблице нет колонки признаков сходимости",
            {std::string(columnKey(Column::Convergence))}
        );
    }
    return convergence_;
}

void SoundingTable::adoptRowCount(size_t size) {
    if (order_.empty()) {
        row_count_ = size;
        return;
    }
    if (size != row_count_) {
        throw InvalidDataError(
            "Длина колонки (" + std::to_string(size) +
            ") не совпадает с количеством строк таблицы (" +
            std::to_string(row_count_) + ")"
        );
    }
}

void SoundingTable::setColumn(Column column, std::vector<double> values) {
    if (column == Column::Convergence) {
        throw InvalidDataError("Колонка признаков сходимости не является числовой");
    }
    adoptRowCount(values.size());
    data_[columnIndex(column)] = std::move(values);
    if (!hasColumn(column)) {
        order_.push_back(column);
    }
}

void SoundingTable::setConvergence(std::vector<ConvergenceState> states) {
    adoptRowCount(states.size());
    convergence_ = std::move(states);
    if (!hasColumn(Column::Convergence)) {
        order_.push_back(Column::Convergence);
    }
}

SoundingTable SoundingTable::withColumn(Column column, std::vector<double> values) const {
    SoundingTable copy = *this;
    copy.setColumn(column, std::move(values));
    return copy;
}

SoundingTable SoundingTable::withConvergence(std::vector<ConvergenceState> states) const {
    SoundingTable copy = *this;
    copy.setConvergence(std::move(states));
    return copy;
}

SoundingTable SoundingTable::selectRows(const std::vector<size_t>& rows) const {
    SoundingTable result;
    result.order_ = order_;
    result.row_count_ = rows.size();

    for (Column column : order_) {
        if (column == Column::Convergence) {
            result.convergence_.reserve(rows.size());
            for (size_t row : rows) {
                result.convergence_.push_back(convergence_.at(row));
            }
            continue;
        }
        const auto& source = data_[columnIndex(column)];
        auto& target = result.data_[columnIndex(column)];
        target.reserve(rows.size());
        for (size_t row : rows) {
            target.push_back(source.at(row));
        }
    }
    return result;
}

bool SoundingTable::identicalTo(const SoundingTable& other) const noexcept {
    if (row_count_ != other.row_count_ || order_ != other.order_) {
        return false;
    }
    for (Column column : order_) {
        if (column == Column::Convergence) {
            if (convergence_ != other.convergence_) {
                return false;
            }
            continue;
        }
        const auto& lhs = data_[columnIndex(column)];
        const auto& rhs = other.data_[columnIndex(column)];
        for (size_t i = 0; i < row_count_; ++i) {
            if (std::bit_cast<std::uint64_t>(lhs[i]) != std::bit_cast<std::uint64_t>(rhs[i])) {
                return false;
            }
        }
    }
    return true;
}

void requireColumns(
    const SoundingTable& table,
    std::initializer_list<Column> columns,
    std::string_view stage
) {
    std::vector<std::string> missing;
    for (Column column : columns) {
        if (!table.hasColumn(column)) {
            missing.emplace_back(columnKey(column));
        }
    }
    if (missing.empty()) return;

    std::string list;
    for (const auto& key : missing) {
        if (!list.empty()) list += ", ";
        list += key;
    }
    throw SchemaError(
        std::string(stage) + ": отсутствуют колонки: " + list,
        std::move(missing)
    );
}

} // namespace conic::model
