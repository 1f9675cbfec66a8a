#include "hoststore/migrate/row_mapping.hpp"
#include "hoststore/storage/fs_ops.hpp"

namespace hoststore::migrate {

namespace {
    // Candidate lists, first present and non-empty wins.
    constexpr const char* kPositive[] = {"positive_prompt", "prompt", "text", "positive"};
    constexpr const char* kNegative[] = {"negative_prompt", "negative", "negative_text"};
    constexpr const char* kSampler[] = {"sampler_settings", "sampler_config"};
    constexpr const char* kGenParams[] = {"generation_params", "metadata"};
    constexpr const char* kCreated[] = {"created_at", "created"};
    constexpr const char* kUpdated[] = {"updated_at", "updated"};

    constexpr const char* kImagePath[] = {"image_path", "file_path", "path", "filepath"};
    constexpr const char* kFilename[] = {"filename", "file_name", "name"};
    constexpr const char* kGenTime[] = {"generation_time"};
    constexpr const char* kWidth[] = {"width", "image_width"};
    constexpr const char* kHeight[] = {"height", "image_height"};
    constexpr const char* kFormat[] = {"format", "image_format"};
    constexpr const char* kWorkflow[] = {"workflow_data", "workflow"};
    constexpr const char* kParameters[] = {"parameters", "metadata"};

    CellValue null_cell() {
        return CellValue{};
    }

    CellValue same_named(const LegacyRow& row, const char* column) {
        const CellValue* v = row.find(column);
        return v ? *v : null_cell();
    }

    CellValue int_or_null(const CellValue* v) {
        if (!v) return null_cell();
        auto i = safe_int(*v);
        return i ? CellValue{*i} : null_cell();
    }

    // Text of the first non-empty candidate, trimmed when asked.
    std::optional<std::string> first_text(const LegacyRow& row, std::span<const char* const> candidates,
                                          bool trimmed) {
        const CellValue* v = first_present(row, candidates);
        if (!v) return std::nullopt;
        auto text = cell_text(*v);
        if (text && trimmed) {
            text = std::string(trim(*text));
        }
        return text;
    }

    CellValue first_or_null(const LegacyRow& row, std::span<const char* const> candidates) {
        const CellValue* v = first_present(row, candidates);
        return v ? *v : null_cell();
    }
}

const char* row_skip_reason_name(RowSkipReason reason) noexcept {
    switch (reason) {
    case RowSkipReason::BadParentReference: return "bad parent reference";
    case RowSkipReason::MissingImagePath: return "missing image path";
    case RowSkipReason::Rejected: return "rejected by canonical table";
    }
    return "unknown";
}

const CellValue* first_present(const LegacyRow& row, std::span<const char* const> candidates) noexcept {
    for (const char* name : candidates) {
        const CellValue* v = row.find(name);
        if (v && !cell_is_empty(*v)) {
            return v;
        }
    }
    return nullptr;
}

void map_prompt_row(const LegacyRow& row, const std::string& now, MappedRow* out) {
    std::vector<CellValue>& v = out->values;
    v.clear();
    v.reserve(13);

    v.emplace_back(int_or_null(row.find("id")));

    auto positive = first_text(row, kPositive, true);
    v.emplace_back(positive ? *positive : std::string());

    auto negative = first_text(row, kNegative, true);
    v.emplace_back(negative ? CellValue{*negative} : null_cell());

    // Timestamps: now only when no candidate exists at all.
    CellValue created = first_or_null(row, kCreated);
    if (cell_is_null(created)) created = now;
    CellValue updated = first_or_null(row, kUpdated);
    if (cell_is_null(updated)) updated = created;
    v.emplace_back(std::move(created));
    v.emplace_back(std::move(updated));

    v.emplace_back(same_named(row, "category"));
    v.emplace_back(same_named(row, "tags"));

    CellValue rating = int_or_null(row.find("rating"));
    if (const auto* r = std::get_if<i64>(&rating); r && (*r < 1 || *r > 5)) {
        rating = null_cell();
    }
    v.emplace_back(std::move(rating));

    v.emplace_back(same_named(row, "notes"));
    v.emplace_back(same_named(row, "hash"));
    v.emplace_back(same_named(row, "model_hash"));
    v.emplace_back(first_or_null(row, kSampler));
    v.emplace_back(first_or_null(row, kGenParams));
}

bool map_image_row(const LegacyRow& row, const std::string& now, MappedRow* out, RowSkip* skip) {
    const CellValue* parent = row.find("prompt_id");
    std::optional<i64> prompt_id = parent ? safe_int(*parent) : std::nullopt;
    if (!prompt_id) {
        if (skip) {
            skip->table = hoststore::db::kImagesTable;
            skip->reason = RowSkipReason::BadParentReference;
            skip->detail = parent ? "prompt_id " + cell_describe(*parent) + " is not an integer"
                                  : "prompt_id is missing";
        }
        return false;
    }

    auto image_path = first_text(row, kImagePath, false);
    if (!image_path) {
        if (skip) {
            skip->table = hoststore::db::kImagesTable;
            skip->reason = RowSkipReason::MissingImagePath;
            skip->detail = "no image path column has a value";
        }
        return false;
    }

    std::vector<CellValue>& v = out->values;
    v.clear();
    v.reserve(12);

    v.emplace_back(int_or_null(row.find("id")));
    v.emplace_back(*prompt_id);
    v.emplace_back(*image_path);

    auto filename = first_text(row, kFilename, false);
    v.emplace_back(filename ? *filename : hoststore::storage::path_filename(*image_path));

    CellValue gen_time = first_or_null(row, kGenTime);
    if (cell_is_null(gen_time)) gen_time = now;
    v.emplace_back(std::move(gen_time));

    v.emplace_back(int_or_null(row.find("file_size")));
    v.emplace_back(int_or_null(first_present(row, kWidth)));
    v.emplace_back(int_or_null(first_present(row, kHeight)));

    auto format = first_text(row, kFormat, true);
    if (!format) {
        std::string ext = hoststore::storage::path_extension(*image_path);
        format = ext;
    }
    v.emplace_back(format->empty() ? null_cell() : CellValue{*format});

    v.emplace_back(first_or_null(row, kWorkflow));
    v.emplace_back(same_named(row, "prompt_metadata"));
    v.emplace_back(first_or_null(row, kParameters));
    return true;
}

bool map_row(hoststore::db::TableId table, const LegacyRow& row, const std::string& now,
             MappedRow* out, RowSkip* skip) {
    if (table == hoststore::db::TableId::Prompts) {
        map_prompt_row(row, now, out);
        return true;
    }
    return map_image_row(row, now, out, skip);
}

} // namespace hoststore::migrate
