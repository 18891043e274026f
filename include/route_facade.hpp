#pragma once
#include "invmod.hpp"
#include <string>

struct RouteResponse {
    int status;
    std::string body;
};

// In-process mapping of the three inverse-mod routes:
//   GET /inverse-mod?x=..&y=..      step narration
//   GET /inverse-mod-z?x=..&y=..    result only
//   GET /inverse-mod-explanation    algorithm explanation
RouteResponse handle_route(const std::string &method, const std::string &target,
                           InverseMode mode = InverseMode::Guaranteed);

// First value of `key` in a query string ("a=1&b=2"), false when absent.
bool query_value(const std::string &query, const std::string &key, std::string &out);
