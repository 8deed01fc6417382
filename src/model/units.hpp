/**
 * @file units.hpp
 * @brief Строго типизированные единицы измерения
 *
 * Типы-обёртки для предотвращения ошибок смешивания единиц
 * (кПа и МПа в данных CPTu встречаются в соседних колонках).
 * Включает литералы для удобства: 1.5_m, 100.0_kPa, 18.0_kN_m3
 */

#pragma once

#include <compare>

namespace conic::model {

struct Kilopascals;

/**
 * @brief Расстояние (глубина) в метрах
 */
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    constexpr Meters operator+(Meters other) const noexcept {
        return Meters{value + other.value};
    }

    constexpr Meters operator-(Meters other) const noexcept {
        return Meters{value - other.value};
    }

    constexpr Meters operator*(double scalar) const noexcept {
        return Meters{value * scalar};
    }

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

/**
 * @brief Давление в мегапаскалях (qc, qt)
 */
struct Megapascals {
    double value;

    constexpr explicit Megapascals(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Kilopascals toKilopascals() const noexcept;

    constexpr auto operator<=>(const Megapascals& other) const noexcept = default;
};

/**
 * @brief Давление в килопаскалях (fs, u2, u0, напряжения)
 */
struct Kilopascals {
    double value;

    constexpr explicit Kilopascals(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Megapascals toMegapascals() const noexcept {
        return Megapascals{value / 1000.0};
    }

    constexpr Kilopascals operator+(Kilopascals other) const noexcept {
        return Kilopascals{value + other.value};
    }

    constexpr Kilopascals operator-(Kilopascals other) const noexcept {
        return Kilopascals{value - other.value};
    }

    constexpr double operator/(Kilopascals other) const noexcept {
        return value / other.value;
    }

    constexpr auto operator<=>(const Kilopascals& other) const noexcept = default;
};

constexpr Kilopascals Megapascals::toKilopascals() const noexcept {
    return Kilopascals{value * 1000.0};
}

/**
 * @brief Удельный вес в кН/м³ (γ грунта, γ воды)
 */
struct UnitWeight {
    double value;

    constexpr explicit UnitWeight(double v = 0.0) noexcept : value(v) {}

    /// Давление столба высотой h: γ·h
    constexpr Kilopascals operator*(Meters height) const noexcept {
        return Kilopascals{value * height.value};
    }

    constexpr auto operator<=>(const UnitWeight& other) const noexcept = default;
};

namespace literals {

constexpr Meters operator""_m(long double v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Meters operator""_m(unsigned long long v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Kilopascals operator""_kPa(long double v) noexcept {
    return Kilopascals{static_cast<double>(v)};
}

constexpr Kilopascals operator""_kPa(unsigned long long v) noexcept {
    return Kilopascals{static_cast<double>(v)};
}

constexpr Megapascals operator""_MPa(long double v) noexcept {
    return Megapascals{static_cast<double>(v)};
}

constexpr UnitWeight operator""_kN_m3(long double v) noexcept {
    return UnitWeight{static_cast<double>(v)};
}

} // namespace literals

} // namespace conic::model
