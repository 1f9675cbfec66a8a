#include "hoststore/db/schema.hpp"

namespace hoststore::db {

using namespace hoststore::core;

namespace {
    constexpr const char* kCreatePrompts = R"SQL(
        CREATE TABLE IF NOT EXISTS prompts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            positive_prompt TEXT NOT NULL,
            negative_prompt TEXT DEFAULT NULL,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            category TEXT,
            tags TEXT,
            rating INTEGER CHECK(rating >= 1 AND rating <= 5),
            notes TEXT,
            hash TEXT UNIQUE,
            model_hash TEXT,
            sampler_settings TEXT,
            generation_params TEXT
        )
    )SQL";

    constexpr const char* kCreateImages = R"SQL(
        CREATE TABLE IF NOT EXISTS generated_images (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            prompt_id INTEGER NOT NULL,
            image_path TEXT NOT NULL,
            filename TEXT NOT NULL,
            generation_time TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            file_size INTEGER,
            width INTEGER,
            height INTEGER,
            format TEXT,
            workflow_data TEXT,
            prompt_metadata TEXT,
            parameters TEXT,
            FOREIGN KEY (prompt_id) REFERENCES prompts(id) ON DELETE CASCADE
        )
    )SQL";

    constexpr const char* kCreateAuxTables = R"SQL(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );

        CREATE TABLE IF NOT EXISTS prompt_tracking (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            prompt_text TEXT NOT NULL,
            node_id TEXT,
            workflow_data TEXT,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            metadata TEXT
        );
    )SQL";

    constexpr const char* kIndexSQL = R"SQL(
        CREATE INDEX IF NOT EXISTS idx_prompts_positive ON prompts(positive_prompt);
        CREATE INDEX IF NOT EXISTS idx_prompts_negative ON prompts(negative_prompt);
        CREATE INDEX IF NOT EXISTS idx_prompts_category ON prompts(category);
        CREATE INDEX IF NOT EXISTS idx_prompts_created_at ON prompts(created_at);
        CREATE INDEX IF NOT EXISTS idx_prompts_hash ON prompts(hash);
        CREATE INDEX IF NOT EXISTS idx_prompts_rating ON prompts(rating);
        CREATE INDEX IF NOT EXISTS idx_prompt_images ON generated_images(prompt_id);
        CREATE INDEX IF NOT EXISTS idx_image_path ON generated_images(image_path);
        CREATE INDEX IF NOT EXISTS idx_generation_time ON generated_images(generation_time);
        CREATE INDEX IF NOT EXISTS idx_tracking_session ON prompt_tracking(session_id);
        CREATE INDEX IF NOT EXISTS idx_tracking_created ON prompt_tracking(created_at);
    )SQL";

    constexpr const char* kPromptColumns[] = {
        "id", "positive_prompt", "negative_prompt", "created_at", "updated_at", "category", "tags",
        "rating", "notes", "hash", "model_hash", "sampler_settings", "generation_params",
    };
    constexpr const char* kPromptMarkers[] = {"prompt", "text", "workflow_name"};

    constexpr const char* kImageColumns[] = {
        "id", "prompt_id", "image_path", "filename", "generation_time", "file_size", "width",
        "height", "format", "workflow_data", "prompt_metadata", "parameters",
    };
    constexpr const char* kImageMarkers[] = {"file_path", "file_name", "metadata"};

    const TableSpec kPromptsSpec{TableId::Prompts, kPromptsTable, kCreatePrompts, kPromptColumns, kPromptMarkers};
    const TableSpec kImagesSpec{TableId::GeneratedImages, kImagesTable, kCreateImages, kImageColumns, kImageMarkers};

    constexpr TableId kManaged[] = {TableId::Prompts, TableId::GeneratedImages};
}

const TableSpec& table_spec(TableId id) noexcept {
    return id == TableId::Prompts ? kPromptsSpec : kImagesSpec;
}

std::span<const TableId> managed_tables() noexcept {
    return kManaged;
}

Status schema_create_tables(DbHandle db) noexcept {
    Status s = db_exec(db, kCreatePrompts);
    if (is_ok(s)) s = db_exec(db, kCreateImages);
    if (is_ok(s)) s = db_exec(db, kCreateAuxTables);
    return s;
}

Status schema_create_indexes(DbHandle db) noexcept {
    return db_exec(db, kIndexSQL);
}

std::string legacy_backup_name(const char* table) {
    std::string name = table ? table : "";
    name += kLegacyBackupSuffix;
    return name;
}

} // namespace hoststore::db
