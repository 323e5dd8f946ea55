#include "tile_pyramid/storage/sqlite_tile_storage.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"
#include "tile_pyramid/io/block_codec.hpp"

#include <sqlite3.h>
#include <cstdio>
#include <iostream>

namespace tile_pyramid::storage {

namespace {

struct TileAddress {
    int layer = 0;
    int x = 0;
    int y = 0;
};

TileAddress parse_key(const std::string& key) {
    TileAddress a;
    if (std::sscanf(key.c_str(), "%d/%d/%d", &a.layer, &a.x, &a.y) != 3) {
        throw IOError("malformed sqlite tile key '" + key + "'");
    }
    return a;
}

std::string table_name(int layer) {
    return "layer" + std::to_string(layer);
}

// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw IOError("sqlite prepare failed (" + sql + "): " + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_int(int idx, int v) { check(sqlite3_bind_int(stmt_, idx, v)); }
    void bind_blob(int idx, const std::vector<uint8_t>& blob) {
        check(sqlite3_bind_blob(stmt_, idx, blob.data(), static_cast<int>(blob.size()),
                                SQLITE_TRANSIENT));
    }

    // True while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw IOError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    sqlite3_stmt* get() { return stmt_; }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw IOError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

SqliteTileStorage::SqliteTileStorage(const fs::path& root, TileComponent component,
                                     size_t cache_size)
    : CachedTileStorage(cache_size),
      db_path_(root / (component_to_string(component) + backend_extension(StorageBackend::SQLITE))) {
    core::ensure_parent_dir(db_path_);

    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw IOError("Cannot open " + db_path_.string() + ": " + msg);
    }

    try {
        Statement tables(db_, "SELECT name FROM sqlite_master WHERE type='table' AND name LIKE 'layer%'");
        while (tables.step()) {
            const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(tables.get(), 0));
            int layer = 0;
            char trailing = 0;
            if (name && std::sscanf(name, "layer%d%c", &layer, &trailing) == 1) {
                tables_.insert(layer);
            }
        }
        exec("BEGIN");
    } catch (const IOError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteTileStorage::~SqliteTileStorage() {
    flush_on_close(db_path_.string());
    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "[STORAGE] Error: final commit failed for " << db_path_.string() << ": "
                  << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_close(db_);
}

void SqliteTileStorage::flush() {
    CachedTileStorage::flush();
    exec("COMMIT");
    exec("BEGIN");
}

std::string SqliteTileStorage::tile_key(int layer, int x, int y) const {
    return std::to_string(layer) + "/" + std::to_string(x) + "/" + std::to_string(y);
}

TileCoordSet SqliteTileStorage::scan_layer(int layer) {
    TileCoordSet coords;
    if (!has_table(layer)) return coords;

    Statement q(db_, "SELECT x, y FROM " + table_name(layer));
    while (q.step()) {
        coords.insert({sqlite3_column_int(q.get(), 0), sqlite3_column_int(q.get(), 1)});
    }
    return coords;
}

std::optional<Matrix2Df> SqliteTileStorage::read_tile(const std::string& key) {
    TileAddress a = parse_key(key);
    if (!has_table(a.layer)) return std::nullopt;

    Statement q(db_, "SELECT data FROM " + table_name(a.layer) + " WHERE x = ? AND y = ?");
    q.bind_int(1, a.x);
    q.bind_int(2, a.y);
    if (!q.step()) return std::nullopt;

    const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(q.get(), 0));
    const int size = sqlite3_column_bytes(q.get(), 0);
    try {
        return io::decode_block(blob, static_cast<size_t>(size));
    } catch (const IOError& e) {
        throw IOError(db_path_.string() + " tile " + key + ": " + e.what());
    }
}

void SqliteTileStorage::write_tile(const std::string& key, const Matrix2Df& tile) {
    TileAddress a = parse_key(key);
    ensure_table(a.layer);

    Statement q(db_, "INSERT OR REPLACE INTO " + table_name(a.layer) +
                     " (x, y, data) VALUES (?, ?, ?)");
    q.bind_int(1, a.x);
    q.bind_int(2, a.y);
    q.bind_blob(3, io::encode_block(tile));
    q.step();
}

bool SqliteTileStorage::remove_tile(const std::string& key) {
    TileAddress a = parse_key(key);
    if (!has_table(a.layer)) return false;

    Statement q(db_, "DELETE FROM " + table_name(a.layer) + " WHERE x = ? AND y = ?");
    q.bind_int(1, a.x);
    q.bind_int(2, a.y);
    q.step();
    return sqlite3_changes(db_) > 0;
}

bool SqliteTileStorage::contains_tile(const std::string& key) {
    TileAddress a = parse_key(key);
    if (!has_table(a.layer)) return false;

    Statement q(db_, "SELECT 1 FROM " + table_name(a.layer) + " WHERE x = ? AND y = ?");
    q.bind_int(1, a.x);
    q.bind_int(2, a.y);
    return q.step();
}

void SqliteTileStorage::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw IOError("sqlite " + sql + " failed on " + db_path_.string() + ": " + msg);
    }
}

void SqliteTileStorage::ensure_table(int layer) {
    if (has_table(layer)) return;
    const std::string table = table_name(layer);
    exec("CREATE TABLE IF NOT EXISTS " + table + " (x INTEGER, y INTEGER, data BLOB)");
    exec("CREATE UNIQUE INDEX IF NOT EXISTS idx_" + table + " ON " + table + " (x, y)");
    tables_.insert(layer);
}

} // namespace tile_pyramid::storage
