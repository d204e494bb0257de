#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace csw {

//format that rows from the table are returned as
using Row = std::vector<std::string>;

//Column definition for a table
using TableKey = std::pair<std::string, //KEY_NAME
                           std::string  //KEY_TYPE
                          >;

using AttributeValuePair = std::pair<std::string,              //attribute name
                                     std::variant<uint64_t,    //possible type
                                                  std::string  //possible type
                                                 >
                                    >;

} //csw
