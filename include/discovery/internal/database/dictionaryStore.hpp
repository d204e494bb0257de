#pragma once

#include "chunkInfo.hpp"
#include "discovery/contentDictionary.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace csw {

//thrown when the store can't be brought into a usable state
class SQLError : public std::runtime_error {
public:
    explicit SQLError(const std::string& what) : std::runtime_error(what) {}
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DictionaryStore
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Mirrors the content dictionary into a SQLite file so a restarted peer
 *    knows who held what before it went down. The in-memory dictionary stays
 *    authoritative, this is only ever written from a snapshot of it and read
 *    back once at startup.
 *
 *    Timestamps in memory are monotonic and meaningless across restarts, so
 *    they are stored as wall clock time. Converting back keeps each entry's
 *    age, which lets the first sweep after a restart evict what went stale
 *    while the peer was down.
 *
 * Member Variables:
 * -> db:
 *    The SQLite database instance.
 *
 * Constructor:
 * -> Takes:
 *    -> db_path:
 *       A path to the database file to either open or create.
 * -> Throws:
 *    -> SQLError:
 *       The file couldn't be opened or the table couldn't be created.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class DictionaryStore {
private:
    sqlite3*    db     = nullptr;
    std::string err_msg = ""; //set on any error

    //populates err_msg for sqliteError(), always returns EXIT_FAILURE
    int reportError(const std::string& err_msg);

public:
    explicit DictionaryStore(const std::string& db_path);
    ~DictionaryStore();

    DictionaryStore(const DictionaryStore&)            = delete;
    DictionaryStore& operator=(const DictionaryStore&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * sqliteError
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Reports the most recent SQLite database error. Should be called after
     *    one of the below functions reports EXIT_FAILURE.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::string sqliteError() const;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * save
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Replaces the stored rows with records, in a single transaction. If
     *    anything fails the previous contents are kept.
     *
     * Takes:
     * -> records:
     *    A ContentDictionary::snapshot().
     * -> now:
     *    The monotonic time the snapshot was taken at.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int save(const std::vector<HolderRecord>& records, TimePoint now);

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * load
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Reads every stored row back. Rows that don't parse are skipped and
     *    logged. dest is cleared first.
     *
     * Takes:
     * -> dest:
     *    Where to put the records.
     * -> now:
     *    Current monotonic time, last_seen values are placed relative to it.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int load(std::vector<HolderRecord>& dest, TimePoint now);
};

} //csw
