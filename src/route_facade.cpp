#include "route_facade.hpp"
#include "bigint_utils.hpp"
#include "narration.hpp"

namespace {

const char* kUsage =
    "To use this, please make the URL match something like:\n"
    "host:port/inverse-mod?x=<<insert positive integer>>&y=<<insert positive integer>>\n";

RouteResponse inverse_route(const std::string &query, bool steps, InverseMode mode) {
    std::string xs, ys;
    if (!query_value(query, "x", xs) || !query_value(query, "y", ys)) {
        return {400, std::string(kUsage) + "\n\n" + algorithm_explanation()};
    }

    cpp_int tmp;
    if (!parse_positive_decimal(xs, tmp) || !parse_positive_decimal(ys, tmp)) {
        return {400, std::string("Error:\n x and/or y is not a positive integer, ") + kUsage};
    }

    InverseOutcome out = compute_inverse(xs, ys, mode);
    if (out.reason == FailureReason::InvalidInput) {
        return {400, format_result(out) + "\n"};
    }
    return {200, steps ? format_steps(out) : format_result(out) + "\n"};
}

} // namespace

bool query_value(const std::string &query, const std::string &key, std::string &out) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        const size_t eq = pair.find('=');
        const std::string k = pair.substr(0, eq);
        if (k == key) {
            out = (eq == std::string::npos) ? std::string() : pair.substr(eq + 1);
            return true;
        }
        pos = amp + 1;
    }
    return false;
}

RouteResponse handle_route(const std::string &method, const std::string &target,
                           InverseMode mode) {
    const size_t q = target.find('?');
    const std::string path = target.substr(0, q);
    const std::string query = (q == std::string::npos) ? std::string() : target.substr(q + 1);

    const bool known = path == "/inverse-mod" || path == "/inverse-mod-z" ||
                       path == "/inverse-mod-explanation";
    if (!known) {
        return {404, "Not found: " + path + "\n"};
    }
    if (method != "GET") {
        return {405, "Method not allowed: " + method + "\n"};
    }

    if (path == "/inverse-mod-explanation") {
        return {200, algorithm_explanation()};
    }
    return inverse_route(query, path == "/inverse-mod", mode);
}
