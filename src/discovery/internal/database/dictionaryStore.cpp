#include "discovery/internal/database/dictionaryStore.hpp"
#include "discovery/internal/database/queries.hpp"
#include "discovery/internal/database/tableInfo.hpp"
#include "discovery/internal/database/types.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <map>
#include <optional>

namespace csw {

static int64_t wallNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * holderKey
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The primary key of a CHUNK_HOLDERS row: ip:port|file|index.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
static std::string holderKey(const HolderRecord& record) {
    return record.holder.toString() + "|" + record.ref.f_name + "|" + std::to_string(record.ref.index);
}

static std::optional<uint64_t> parseColumn(const std::string& text, uint64_t max) {
    if (text.empty() || text[0] == '-')
        return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long val = std::strtoull(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || val > max)
        return std::nullopt;
    return val;
}

DictionaryStore::DictionaryStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw SQLError("Could not open " + db_path + ": " + reason);
    }

    auto err_val = createTable(db, HOLDERS_NAME, HOLDERS_KEY, HOLDERS_ATTRIBUTES);
    if (err_val) {
        sqlite3_close(db);
        throw SQLError(err_val.value());
    }
}

DictionaryStore::~DictionaryStore() {
    sqlite3_close(db);
}

std::string DictionaryStore::sqliteError() const {
    return err_msg;
}

int DictionaryStore::reportError(const std::string& e) {
    err_msg = e;
    return EXIT_FAILURE;
}

int DictionaryStore::save(const std::vector<HolderRecord>& records, TimePoint now) {
    const int64_t wall_now = wallNowMs();

    //one row per key, the freshest record wins
    std::map<std::string, const HolderRecord*> rows;
    for (const HolderRecord& record : records) {
        auto [it, inserted] = rows.emplace(holderKey(record), &record);
        if (!inserted && record.last_seen > it->second->last_seen)
            it->second = &record;
    }

    auto err_val = doExec(db, "BEGIN TRANSACTION;");
    if (err_val)
        return reportError(err_val.value());

    err_val = doClear(db, HOLDERS_NAME);
    for (auto it = rows.begin(); !err_val && it != rows.end(); ++it) {
        const HolderRecord& record = *it->second;

        int64_t age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - record.last_seen).count();
        if (age_ms < 0)
            age_ms = 0;
        int64_t seen_ms = wall_now - age_ms;
        if (seen_ms < 0)
            seen_ms = 0;

        std::vector<AttributeValuePair> values = {
            {HOLDERS_KEY.first,             it->first},
            {HOLDERS_ATTRIBUTES[0].first,   record.ref.f_name},
            {HOLDERS_ATTRIBUTES[1].first,   uint64_t(record.ref.index)},
            {HOLDERS_ATTRIBUTES[2].first,   uint64_t(record.chunk_total)},
            {HOLDERS_ATTRIBUTES[3].first,   identityToHex(record.ref.identity)},
            {HOLDERS_ATTRIBUTES[4].first,   record.holder.ip_addr},
            {HOLDERS_ATTRIBUTES[5].first,   uint64_t(record.holder.port)},
            {HOLDERS_ATTRIBUTES[6].first,   uint64_t(seen_ms)}
        };
        err_val = doInsert(db, HOLDERS_NAME, values);
    }

    if (err_val) {
        auto rollback_err = doExec(db, "ROLLBACK;");
        if (rollback_err)
            std::cerr << "[DictionaryStore] Rollback failed: " << rollback_err.value() << std::endl;
        return reportError(err_val.value());
    }

    err_val = doExec(db, "COMMIT;");
    if (err_val) {
        auto rollback_err = doExec(db, "ROLLBACK;");
        if (rollback_err)
            std::cerr << "[DictionaryStore] Rollback failed: " << rollback_err.value() << std::endl;
        return reportError(err_val.value());
    }

    return EXIT_SUCCESS;
}

int DictionaryStore::load(std::vector<HolderRecord>& dest, TimePoint now) {
    dest.clear();

    std::vector<std::string> columns = {HOLDERS_KEY.first};
    for (const TableKey& attr : HOLDERS_ATTRIBUTES)
        columns.push_back(attr.first);

    std::vector<Row> rows;
    auto err_val = doSelect(db, HOLDERS_NAME, columns, {}, rows);
    if (err_val)
        return reportError(err_val.value());

    const int64_t wall_now = wallNowMs();
    for (const Row& row : rows) {
        if (row.size() != columns.size()) {
            std::cerr << "[DictionaryStore] Skipping short row." << std::endl;
            continue;
        }

        auto index     = parseColumn(row[2], std::numeric_limits<uint32_t>::max());
        auto total     = parseColumn(row[3], std::numeric_limits<uint32_t>::max());
        auto identity  = identityFromHex(row[4]);
        auto port      = parseColumn(row[6], std::numeric_limits<uint16_t>::max());
        auto seen_ms   = parseColumn(row[7], std::numeric_limits<int64_t>::max());

        if (!index || !total || !identity || !port || !seen_ms ||
            row[1].empty() || row[5].empty() || *port == 0 || *index >= *total) {
            std::cerr << "[DictionaryStore] Skipping malformed row " << row[0] << std::endl;
            continue;
        }

        int64_t age_ms = wall_now - static_cast<int64_t>(*seen_ms);
        if (age_ms < 0)
            age_ms = 0;

        HolderRecord record;
        record.ref          = ChunkRef{row[1], static_cast<uint32_t>(*index), *identity};
        record.chunk_total  = static_cast<uint32_t>(*total);
        record.holder       = PeerAddress{row[5], static_cast<uint16_t>(*port)};
        record.last_seen    = now - std::chrono::milliseconds(age_ms);
        dest.push_back(std::move(record));
    }

    return EXIT_SUCCESS;
}

} //csw
