module;

#include <coopmod/config.hpp>
#include <nlohmann/json.hpp>

module coopmod.core.log;

import std;

namespace logger::detail {

using json = nlohmann::json;

std::string json_line(level lv, std::string_view timestamp, std::string_view name,
                      std::string_view source, std::string_view message) {
    json record = {
        {"timestamp", timestamp},
        {"level",     level_name(lv)},
        {"logger",    name},
        {"source",    source},
        {"message",   message},
    };
    // Messages may carry arbitrary bytes: invalid UTF-8 becomes U+FFFD
    return record.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace logger::detail
