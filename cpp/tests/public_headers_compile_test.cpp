#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "hoststore/context/store_context.hpp"
#include "hoststore/core/config.hpp"
#include "hoststore/core/errors.hpp"
#include "hoststore/core/log.hpp"
#include "hoststore/core/types.hpp"
#include "hoststore/db/db.hpp"
#include "hoststore/db/schema.hpp"
#include "hoststore/migrate/legacy_importer.hpp"
#include "hoststore/migrate/legacy_row.hpp"
#include "hoststore/migrate/row_mapping.hpp"
#include "hoststore/migrate/schema_migrator.hpp"
#include "hoststore/settings/database_locator.hpp"
#include "hoststore/settings/settings_store.hpp"
#include "hoststore/storage/data_dir.hpp"
#include "hoststore/storage/fs_ops.hpp"
#include "hoststore/storage/hashing.hpp"
#include "hoststore/storage/relocator.hpp"
#include "hoststore/storage/root_resolver.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
