#pragma once

#include "discovery/internal/database/types.hpp"
#include <utility>

namespace csw {

// TABLE NAMES
inline constexpr char HOLDERS_NAME[] = "CHUNK_HOLDERS";

// PRIMARY KEYS
inline const TableKey HOLDERS_KEY = {"holder", "TEXT"}; //ip:port|file|index, derived manually

// ATTRIBUTES DEFINITIONS
// the order here is the column order doSelect returns rows in
inline const std::vector<TableKey> HOLDERS_ATTRIBUTES = {
    std::make_pair("file",        "TEXT"),
    std::make_pair("chunk_index", "INT"),
    std::make_pair("chunk_total", "INT"),
    std::make_pair("digest",      "TEXT"),
    std::make_pair("ip_addr",     "TEXT"),
    std::make_pair("port",        "INT"),
    std::make_pair("last_seen",   "INT")  //ms since Unix epoch
};

} //csw
