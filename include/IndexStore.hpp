#pragma once
#include <string>
#include <mutex>
#include "sqlite3.h"
#include "Types.hpp"

class IndexStore
{
public:
    enum class Mode
    {
        ReadOnly,   // query side
        ReadWrite   // builder
    };

    static constexpr std::size_t DEFAULT_BATCH_SIZE = 5000;

private:
    sqlite3* db;
    std::string path;
    Mode mode;
    bool lost;
    std::mutex mutex;

    void open();
    void close() noexcept;
    void exec(char const* sql);
    void rollback() noexcept;
    std::string activeTableLocked();
    int nextVersionLocked();
    void upsertBatch(std::string const& table, CandidateStationSet::const_iterator begin, CandidateStationSet::const_iterator end);
    void swapActiveTable(std::string const& table, int version);

public:
    IndexStore(std::string const& path, Mode mode);
    ~IndexStore();

    IndexStore(IndexStore const&) = delete;
    IndexStore& operator=(IndexStore const&) = delete;

    // Union of the station sets of all cells within Grid::SEARCH_RADIUS of the
    // query. Throws IndexStoreError and marks the connection lost on failure.
    StationIdSet getCandidates(double lat, double lon);

    // Builds a new table version and makes it active in one transaction.
    // Returns the new table's name.
    std::string writeIndex(CandidateStationSet const& cells, std::size_t batchSize = DEFAULT_BATCH_SIZE);

    // Guards against concurrent builder runs; force clears a stale lock.
    void acquireBuildLock(bool force);
    void releaseBuildLock();

    [[nodiscard]] bool isConnected() const noexcept;

    // Reopens the database. Throws IndexStoreFatalError when that fails.
    void reconnect();

    std::string activeTable();

    static std::string encodeStations(StationIdSet const& stations);
    static StationIdSet decodeStations(void const* data, int size);
};
