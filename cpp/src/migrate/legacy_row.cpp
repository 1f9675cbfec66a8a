#include "hoststore/migrate/legacy_row.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace hoststore::migrate {

namespace {
    bool iequals(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return false;
        }
        return true;
    }

    bool is_space(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool cell_is_empty(const CellValue& v) noexcept {
    if (cell_is_null(v)) return true;
    if (const auto* s = std::get_if<std::string>(&v)) return trim(*s).empty();
    if (const auto* b = std::get_if<Blob>(&v)) return b->empty();
    return false;
}

std::optional<i64> safe_int(const CellValue& v) noexcept {
    if (const auto* i = std::get_if<i64>(&v)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&v)) {
        if (!std::isfinite(*d)) return std::nullopt;
        const double t = std::trunc(*d);
        if (t < static_cast<double>(std::numeric_limits<i64>::min()) ||
            t >= static_cast<double>(std::numeric_limits<i64>::max())) {
            return std::nullopt;
        }
        return static_cast<i64>(t);
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        std::string_view t = trim(*s);
        if (!t.empty() && t.front() == '+') t.remove_prefix(1);
        if (t.empty()) return std::nullopt;
        i64 out = 0;
        auto [end, ec] = std::from_chars(t.data(), t.data() + t.size(), out);
        if (ec != std::errc{} || end != t.data() + t.size()) return std::nullopt;
        return out;
    }
    return std::nullopt;
}

std::optional<std::string> cell_text(const CellValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* i = std::get_if<i64>(&v)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&v)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.15g", *d);
        return std::string(buf);
    }
    if (const auto* b = std::get_if<Blob>(&v)) return std::string(b->begin(), b->end());
    return std::nullopt;
}

std::string cell_describe(const CellValue& v) {
    if (cell_is_null(v)) return "NULL";
    if (std::holds_alternative<Blob>(v)) {
        return "<blob " + std::to_string(std::get<Blob>(v).size()) + " bytes>";
    }
    std::string text = *cell_text(v);
    if (text.size() > 40) {
        text.resize(40);
        text += "...";
    }
    return "'" + text + "'";
}

void LegacyRow::set(std::string column, CellValue value) {
    for (auto& cell : cells_) {
        if (iequals(cell.first, column)) {
            cell.second = std::move(value);
            return;
        }
    }
    cells_.emplace_back(std::move(column), std::move(value));
}

const CellValue* LegacyRow::find(std::string_view column) const noexcept {
    for (const auto& cell : cells_) {
        if (iequals(cell.first, column)) {
            return &cell.second;
        }
    }
    return nullptr;
}

} // namespace hoststore::migrate
