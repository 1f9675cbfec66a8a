#pragma once

#include <span>
#include <string>
#include <vector>

#include "hoststore/db/schema.hpp"
#include "hoststore/migrate/legacy_row.hpp"

namespace hoststore::migrate {

    enum class RowSkipReason : hoststore::core::u8 {
        BadParentReference = 1,  // prompt_id missing or not an integer
        MissingImagePath = 2,    // no candidate column carried a path
        Rejected = 3,            // the canonical table refused the row
    };

    [[nodiscard]] const char* row_skip_reason_name(RowSkipReason reason) noexcept;

    struct RowSkip {
        std::string table;
        i64 legacy_rowid{0};
        RowSkipReason reason{RowSkipReason::Rejected};
        std::string detail;
    };

    // Values aligned with db::table_spec(table).columns.
    struct MappedRow {
        std::vector<CellValue> values;
    };

    // First candidate that is present and not empty, or nullptr.
    [[nodiscard]] const CellValue* first_present(const LegacyRow& row,
                                                 std::span<const char* const> candidates) noexcept;

    // Map a legacy prompts row. now fills timestamps that are entirely absent.
    // Prompts rows always map.
    void map_prompt_row(const LegacyRow& row, const std::string& now, MappedRow* out);

    // Map a legacy generated_images row; returns false and fills *skip when the
    // row cannot be carried over.
    [[nodiscard]] bool map_image_row(const LegacyRow& row, const std::string& now, MappedRow* out, RowSkip* skip);

    // Dispatch on table id.
    [[nodiscard]] bool map_row(hoststore::db::TableId table, const LegacyRow& row, const std::string& now,
                               MappedRow* out, RowSkip* skip);

} // namespace hoststore::migrate
