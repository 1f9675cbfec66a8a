#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "hoststore/core/types.hpp"

namespace hoststore::migrate {
    using i64 = hoststore::core::i64;

    using Blob = std::vector<hoststore::core::u8>;

    // One SQLite value: NULL, INTEGER, REAL, TEXT or BLOB.
    using CellValue = std::variant<std::monostate, i64, double, std::string, Blob>;

    [[nodiscard]] inline bool cell_is_null(const CellValue& v) noexcept {
        return std::holds_alternative<std::monostate>(v);
    }

    // Null, an empty blob, or text that is empty after trimming whitespace.
    [[nodiscard]] bool cell_is_empty(const CellValue& v) noexcept;

    // Integers as-is, finite reals truncated, decimal text after trimming.
    [[nodiscard]] std::optional<i64> safe_int(const CellValue& v) noexcept;

    // Text form of a non-null cell; std::nullopt for null.
    [[nodiscard]] std::optional<std::string> cell_text(const CellValue& v);

    [[nodiscard]] std::string_view trim(std::string_view s) noexcept;

    // Short printable form for log lines.
    [[nodiscard]] std::string cell_describe(const CellValue& v);

    // A row read from a legacy table, keyed by whatever columns that table had.
    class LegacyRow {
    public:
        LegacyRow() = default;

        void set(std::string column, CellValue value);

        // Column names compare case-insensitively, as SQLite does.
        [[nodiscard]] const CellValue* find(std::string_view column) const noexcept;
        [[nodiscard]] bool has(std::string_view column) const noexcept { return find(column) != nullptr; }

        [[nodiscard]] std::size_t size() const noexcept { return cells_.size(); }
        void clear() noexcept { cells_.clear(); }

        [[nodiscard]] const std::vector<std::pair<std::string, CellValue>>& cells() const noexcept { return cells_; }

    private:
        std::vector<std::pair<std::string, CellValue>> cells_;
    };

} // namespace hoststore::migrate
