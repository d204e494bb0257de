#include "discovery/internal/database/queries.hpp"

namespace csw {

static std::optional<std::string> runQuery(sqlite3*           db,
                                           const std::string& query,
                                           int              (*cb)(void*, int, char**, char**),
                                           void*              data) {
    char* err = nullptr;
    int   res = sqlite3_exec(db, query.c_str(), cb, data, &err);
    if (res == SQLITE_OK)
        return std::nullopt;

    std::string message = err ? err : sqlite3_errstr(res);
    sqlite3_free(err);
    return message;
}

std::optional<std::string> createTable(sqlite3*                     db,
                                       const std::string&           name,
                                       const TableKey&              primary_key,
                                       const std::vector<TableKey>& attributes) {
    std::string query;
    query += "CREATE TABLE IF NOT EXISTS " + name + "(";

    //primary key
    query += primary_key.first + " " + primary_key.second + " PRIMARY KEY NOT NULL";

    //attributes
    for (auto& entry : attributes) {
        query += ",";
        query += entry.first + " " + entry.second;
    }

    query += ");";

    return runQuery(db, query, nullptr, nullptr);
}

static int callback(void* data, int columns, char** col_vals, char** col_names) {
    (void)col_names;
    auto* selected_rows = static_cast<std::vector<Row>*>(data);
    Row row;
    row.reserve(columns);
    for (int i = 0; i < columns; ++i)
        row.emplace_back(col_vals[i] ? col_vals[i] : "");
    selected_rows->push_back(std::move(row));
    return 0;
}

std::optional<std::string> doSelect(sqlite3*                        db,
                                    const std::string&              table_name,
                                    const std::vector<std::string>& attributes,
                                    const std::vector<std::string>& conditions,
                                          std::vector<Row>&         dest) {
    std::string query = "SELECT ";

    //to select
    for (size_t i = 0; i < attributes.size(); i++) {
        if (i == 0)
            query += attributes.at(i);
        else
            query += "," + attributes.at(i);
    }

    query += " FROM " + table_name;

    //restrict on conditions
    if (!conditions.empty()) {
        query += " WHERE ";
        for (size_t i = 0; i < conditions.size(); i++) {
            if (i == 0)
                query += conditions.at(i);
            else
                query += " AND " + conditions.at(i);
        }
    }

    query += ";";

    //puts selected rows into dest via callback
    return runQuery(db, query, callback, &dest);
}

static std::string castVariant(const std::variant<uint64_t, std::string>& val) {
    if (auto v = std::get_if<uint64_t>(&val))
        return std::to_string(*v);

    std::string quoted = "'";
    for (char c : std::get<std::string>(val)) {
        if (c == '\'')
            quoted += '\'';
        quoted += c;
    }
    return quoted + "'";
}

std::optional<std::string> doInsert(sqlite3*                               db,
                                    const std::string&                     table_name,
                                    const std::vector<AttributeValuePair>& values) {
    std::string query = "INSERT INTO " + table_name + "(";

    //build value string at the same time
    std::string value_string = "(";
    for (size_t i = 0; i < values.size(); i++) {
        if (i != 0) {
            query += ",";
            value_string += ",";
        }

        query += values.at(i).first;
        value_string += castVariant(values.at(i).second);
    }

    //append value string
    query += ") VALUES " + value_string + ");";

    return runQuery(db, query, nullptr, nullptr);
}

std::optional<std::string> doExec(sqlite3* db, const std::string& statement) {
    return runQuery(db, statement, nullptr, nullptr);
}

std::optional<std::string> doClear(sqlite3* db, const std::string& table_name) {
    return runQuery(db, "DELETE FROM " + table_name + ";", nullptr, nullptr);
}

} //csw
