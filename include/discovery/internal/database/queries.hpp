#pragma once

#include "discovery/internal/database/types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

/*
 * Thin helpers that build SQL text and run it through sqlite3_exec. Every
 * helper returns std::nullopt on success, or SQLite's error message.
 *
 * String values are quoted with embedded single quotes doubled, so names
 * received from the network can't break out of the literal.
 */

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createTable
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a table, if one by that name doesn't exist yet.
 *
 * Takes:
 * -> db:
 *    The open database.
 * -> name:
 *    Table name.
 * -> primary_key:
 *    Name and type of the primary key column.
 * -> attributes:
 *    Name and type of every other column.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::string> createTable(sqlite3*                     db,
                                       const std::string&           name,
                                       const TableKey&              primary_key,
                                       const std::vector<TableKey>& attributes);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * doSelect
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Selects attributes from table_name for rows matching every condition.
 *    Rows are appended to dest as strings, in attribute order. NULL columns
 *    come back as empty strings.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::string> doSelect(sqlite3*                        db,
                                    const std::string&              table_name,
                                    const std::vector<std::string>& attributes,
                                    const std::vector<std::string>& conditions,
                                          std::vector<Row>&         dest);

//INSERT INTO table_name, one column per pair
std::optional<std::string> doInsert(sqlite3*                               db,
                                    const std::string&                     table_name,
                                    const std::vector<AttributeValuePair>& values);

//DELETE FROM table_name, every row
std::optional<std::string> doClear(sqlite3* db, const std::string& table_name);

//runs a bare statement, used for BEGIN/COMMIT/ROLLBACK and PRAGMAs
std::optional<std::string> doExec(sqlite3* db, const std::string& statement);

} //csw
