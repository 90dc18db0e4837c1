#include <ctime>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <vector>
#include "IndexStore.hpp"
#include "Errors.hpp"
#include "Grid.hpp"
#include "station_set.pb.h"

namespace
{

constexpr char const* TABLE_PREFIX = "cell_stations_v";

// Finalizes on scope exit so a throwing caller never leaks a prepared statement.
struct Statement
{
    sqlite3_stmt* stmt = nullptr;

    Statement(sqlite3* db, std::string const& sql)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string err = sqlite3_errmsg(db);
            stmt = nullptr;
            throw IndexStoreError("Failed to prepare '" + sql + "': " + err);
        }
    }

    ~Statement()
    {
        if (stmt) sqlite3_finalize(stmt);
    }

    Statement(Statement const&) = delete;
    Statement& operator=(Statement const&) = delete;
};

bool isIndexTable(std::string const& name)
{
    std::string prefix = TABLE_PREFIX;
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
        return false;
    return std::all_of(name.begin() + prefix.size(), name.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::string columnText(sqlite3_stmt* stmt, int col)
{
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}

IndexStore::IndexStore(std::string const& path, Mode mode)
    : db(nullptr), path(path), mode(mode), lost(false)
{
    try
    {
        open();
        if (mode == Mode::ReadOnly)
        {
            std::string table = activeTableLocked();
            std::cout << "[Store] Serving index table " << table << " from " << path << "\n";
        }
    }
    catch (IndexStoreError const& e)
    {
        close();
        throw IndexStoreFatalError(std::string("Cannot use index store: ") + e.what());
    }
}

IndexStore::~IndexStore()
{
    close();
}

void IndexStore::open()
{
    int flags = mode == Mode::ReadOnly
        ? SQLITE_OPEN_READONLY
        : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        close();
        throw IndexStoreError("Failed to open SQLite DB " + path + ": " + err);
    }

    sqlite3_busy_timeout(db, 5000);

    if (mode == Mode::ReadWrite)
    {
        exec("PRAGMA journal_mode=WAL;");
        exec("CREATE TABLE IF NOT EXISTS index_meta ("
             "  key TEXT PRIMARY KEY, "
             "  value TEXT NOT NULL"
             ");");
    }
}

void IndexStore::close() noexcept
{
    if (db)
    {
        sqlite3_close_v2(db);
        db = nullptr;
    }
}

void IndexStore::exec(char const* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string err = errMsg ? errMsg : sqlite3_errstr(rc);
        if (errMsg) sqlite3_free(errMsg);
        throw IndexStoreError(std::string("SQLite statement failed (") + sql + "): " + err);
    }
}

void IndexStore::rollback() noexcept
{
    if (db && sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK && !sqlite3_get_autocommit(db))
        std::cerr << "[Store] Rollback failed: " << sqlite3_errmsg(db) << "\n";
}

std::string IndexStore::activeTableLocked()
{
    Statement s(db, "SELECT value FROM index_meta WHERE key = 'active_table';");

    int rc = sqlite3_step(s.stmt);
    if (rc == SQLITE_DONE)
        throw IndexStoreError("No index has been built into " + path);
    if (rc != SQLITE_ROW)
        throw IndexStoreError(std::string("Failed to read active table: ") + sqlite3_errmsg(db));

    std::string table = columnText(s.stmt, 0);
    if (!isIndexTable(table))
        throw IndexStoreError("Active table pointer '" + table + "' is not an index table");
    return table;
}

std::string IndexStore::activeTable()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (!db)
        throw IndexStoreError("index store connection lost");
    return activeTableLocked();
}

StationIdSet IndexStore::getCandidates(double lat, double lon)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (!db || lost)
        throw IndexStoreError("index store connection lost");

    CellWindow w = Grid::window(lat, lon);
    StationIdSet result;

    try
    {
        // One read transaction: pointer and rows come from the same snapshot.
        exec("BEGIN;");

        std::string table = activeTableLocked();
        Statement s(db, "SELECT stations FROM " + table +
                        " WHERE lat_idx BETWEEN ?1 AND ?2 AND lon_idx BETWEEN ?3 AND ?4;");

        sqlite3_bind_int(s.stmt, 1, w.minLat);
        sqlite3_bind_int(s.stmt, 2, w.maxLat);
        sqlite3_bind_int(s.stmt, 3, w.minLon);
        sqlite3_bind_int(s.stmt, 4, w.maxLon);

        int rc;
        while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW)
        {
            StationIdSet cell = decodeStations(sqlite3_column_blob(s.stmt, 0),
                                               sqlite3_column_bytes(s.stmt, 0));
            result.insert(cell.begin(), cell.end());
        }

        if (rc != SQLITE_DONE)
            throw IndexStoreError(std::string("Error stepping candidate lookup: ") + sqlite3_errmsg(db));

        exec("COMMIT;");
    }
    catch (IndexStoreError const&)
    {
        lost = true;
        rollback();
        throw;
    }

    return result;
}

bool IndexStore::isConnected() const noexcept
{
    return db != nullptr && !lost;
}

void IndexStore::reconnect()
{
    std::lock_guard<std::mutex> lock(mutex);

    std::cerr << "[Store] Reconnecting to " << path << "\n";
    close();

    try
    {
        open();
        std::string table = activeTableLocked();
        lost = false;
        std::cout << "[Store] Reconnected, serving " << table << "\n";
    }
    catch (IndexStoreError const& e)
    {
        close();
        throw IndexStoreFatalError(std::string("Index store unreachable: ") + e.what());
    }
}

void IndexStore::acquireBuildLock(bool force)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (force)
        exec("DELETE FROM index_meta WHERE key = 'build_lock';");

    Statement s(db, "INSERT INTO index_meta (key, value) VALUES ('build_lock', ?);");
    std::string since = std::to_string(std::time(nullptr));
    sqlite3_bind_text(s.stmt, 1, since.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(s.stmt);
    if (rc == SQLITE_CONSTRAINT)
        throw IndexStoreError("Another index build holds the lock on " + path + " (use --force to clear a stale lock)");
    if (rc != SQLITE_DONE)
        throw IndexStoreError(std::string("Failed to take build lock: ") + sqlite3_errmsg(db));
}

void IndexStore::releaseBuildLock()
{
    std::lock_guard<std::mutex> lock(mutex);
    exec("DELETE FROM index_meta WHERE key = 'build_lock';");
}

int IndexStore::nextVersionLocked()
{
    Statement s(db, "SELECT value FROM index_meta WHERE key = 'version';");
    int rc = sqlite3_step(s.stmt);
    if (rc == SQLITE_ROW)
        return std::stoi(columnText(s.stmt, 0)) + 1;
    if (rc == SQLITE_DONE)
        return 1;
    throw IndexStoreError(std::string("Failed to read index version: ") + sqlite3_errmsg(db));
}

void IndexStore::upsertBatch(std::string const& table,
                             CandidateStationSet::const_iterator begin,
                             CandidateStationSet::const_iterator end)
{
    exec("BEGIN TRANSACTION;");
    try
    {
        Statement s(db, "INSERT INTO " + table + " (lat_idx, lon_idx, stations) VALUES (?, ?, ?) "
                        "ON CONFLICT(lat_idx, lon_idx) DO UPDATE SET stations = excluded.stations;");

        for (auto it = begin; it != end; ++it)
        {
            std::string blob = encodeStations(it->second);

            sqlite3_reset(s.stmt);
            sqlite3_bind_int(s.stmt, 1, it->first.latIdx);
            sqlite3_bind_int(s.stmt, 2, it->first.lonIdx);
            sqlite3_bind_blob(s.stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

            if (sqlite3_step(s.stmt) != SQLITE_DONE)
                throw IndexStoreError(std::string("SQLite upsert failed: ") + sqlite3_errmsg(db));
        }

        exec("COMMIT;");
    }
    catch (IndexStoreError const&)
    {
        rollback();
        throw;
    }
}

void IndexStore::swapActiveTable(std::string const& table, int version)
{
    std::vector<std::string> stale;
    std::string previous;
    {
        Statement s(db, "SELECT value FROM index_meta WHERE key = 'active_table';");
        if (sqlite3_step(s.stmt) == SQLITE_ROW)
            previous = columnText(s.stmt, 0);
    }
    {
        Statement s(db, "SELECT name FROM sqlite_master WHERE type = 'table' AND name LIKE 'cell_stations_v%';");
        while (sqlite3_step(s.stmt) == SQLITE_ROW)
        {
            std::string name = columnText(s.stmt, 0);
            // The retired table stays one generation so readers mid-query can finish.
            if (isIndexTable(name) && name != table && name != previous)
                stale.push_back(name);
        }
    }

    exec("BEGIN IMMEDIATE;");
    try
    {
        Statement s(db, "INSERT INTO index_meta (key, value) VALUES ('active_table', ?1), ('version', ?2) "
                        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
        std::string v = std::to_string(version);
        sqlite3_bind_text(s.stmt, 1, table.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s.stmt, 2, v.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(s.stmt) != SQLITE_DONE)
            throw IndexStoreError(std::string("Failed to switch active table: ") + sqlite3_errmsg(db));

        for (std::string const& name : stale)
        {
            std::string drop = "DROP TABLE IF EXISTS " + name + ";";
            exec(drop.c_str());
        }

        exec("COMMIT;");
    }
    catch (IndexStoreError const&)
    {
        rollback();
        throw;
    }

    std::cout << "[Store] Active index is now " << table;
    if (!previous.empty())
        std::cout << " (retired " << previous << ")";
    std::cout << "\n";
}

std::string IndexStore::writeIndex(CandidateStationSet const& cells, std::size_t batchSize)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (mode != Mode::ReadWrite)
        throw IndexStoreError("Index store opened read-only");
    if (batchSize == 0)
        batchSize = DEFAULT_BATCH_SIZE;

    int version = nextVersionLocked();
    std::string table = TABLE_PREFIX + std::to_string(version);

    std::string drop = "DROP TABLE IF EXISTS " + table + ";";
    exec(drop.c_str());
    std::string create =
        "CREATE TABLE " + table + " ("
        "  lat_idx INTEGER NOT NULL, "
        "  lon_idx INTEGER NOT NULL, "
        "  stations BLOB NOT NULL, "
        "  PRIMARY KEY (lat_idx, lon_idx)"
        ") WITHOUT ROWID;";
    exec(create.c_str());

    std::cout << "[Store] Writing " << cells.size() << " cells into " << table
              << " in batches of " << batchSize << "\n";

    auto it = cells.begin();
    std::size_t written = 0;
    while (it != cells.end())
    {
        auto batchEnd = it;
        std::size_t n = 0;
        while (batchEnd != cells.end() && n < batchSize)
        {
            ++batchEnd;
            ++n;
        }

        upsertBatch(table, it, batchEnd);
        written += n;
        it = batchEnd;
    }

    swapActiveTable(table, version);
    std::cout << "[Store] Index build complete: " << written << " cells.\n";
    return table;
}

std::string IndexStore::encodeStations(StationIdSet const& stations)
{
    train_locator::StationSet message;
    for (StationId id : stations)
        message.add_ids(id);

    std::string out;
    if (!message.SerializeToString(&out))
        throw IndexStoreError("Failed to serialize station set");
    return out;
}

StationIdSet IndexStore::decodeStations(void const* data, int size)
{
    StationIdSet out;
    if (!data || size <= 0)
        return out;

    train_locator::StationSet message;
    if (!message.ParseFromArray(data, size))
        throw IndexStoreError("Corrupt station set blob");

    for (auto id : message.ids())
        out.insert(id);
    return out;
}
