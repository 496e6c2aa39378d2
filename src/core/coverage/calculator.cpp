#include "wirecheck/core/coverage/calculator.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>
#include <tuple>


namespace wirecheck::core::coverage {

namespace {

using Segments = std::vector<std::string>;

[[nodiscard]]
std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

[[nodiscard]]
Segments split(std::string_view normalized) {
    Segments out;
    std::size_t pos = 0;
    while (pos < normalized.size()) {
        if (normalized[pos] == '/') {
            ++pos;
            continue;
        }
        const std::size_t end = normalized.find('/', pos);
        const std::size_t stop = end == std::string_view::npos ? normalized.size() : end;
        out.emplace_back(normalized.substr(pos, stop - pos));
        pos = stop;
    }
    return out;
}

[[nodiscard]]
bool is_param(std::string_view seg) noexcept {
    return seg.size() > 2 && seg.front() == '{' && seg.back() == '}';
}

struct CompiledEntry {
    std::string method;
    Segments segments;
    std::size_t params{0};
};

// Returns the number of parameters used, or -1 when not matching
[[nodiscard]]
long match(const CompiledEntry& entry, std::string_view method, const Segments& path) noexcept {
    if (entry.method != method || entry.segments.size() != path.size()) {
        return -1;
    }
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (is_param(entry.segments[i])) {
            if (path[i].empty()) return -1;
            continue;
        }
        if (entry.segments[i] != path[i]) return -1;
    }
    return static_cast<long>(entry.params);
}

[[nodiscard]]
std::vector<int> sorted_unique(std::vector<int> v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    return v;
}

} // namespace

std::string normalize_path(std::string_view url) {
    // Drop scheme and authority
    const std::size_t scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        const std::size_t path_start = url.find('/', scheme + 3);
        url = path_start == std::string_view::npos ? std::string_view{} : url.substr(path_start);
    }
    // Drop query and fragment
    const std::size_t cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    std::string out;
    for (const auto& seg : split(url)) {
        out += '/';
        out += seg;
    }
    return out.empty() ? std::string("/") : out;
}

Report evaluate(const std::vector<Call>& calls, const Catalog& catalog) {
    Report report;
    report.entries.reserve(catalog.size());

    std::vector<CompiledEntry> compiled;
    compiled.reserve(catalog.size());
    std::vector<std::set<int>> observed(catalog.size());

    for (const auto& entry : catalog) {
        CompiledEntry c;
        c.method = upper(entry.method);
        c.segments = split(normalize_path(entry.path));
        c.params = static_cast<std::size_t>(std::count_if(c.segments.begin(), c.segments.end(),
            [](const std::string& s) { return is_param(s); }));
        compiled.push_back(std::move(c));

        EntryCoverage ec;
        ec.entry = entry;
        ec.entry.method = upper(entry.method);
        ec.entry.statuses = sorted_unique(entry.statuses);
        report.entries.push_back(std::move(ec));
    }

    std::set<std::tuple<std::string, std::string, int>> seen_uncatalogued;

    for (const auto& call : calls) {
        const std::string method = upper(call.method);
        const std::string path = normalize_path(call.path);
        const Segments segments = split(path);

        long best_params = -1;
        std::size_t best = catalog.size();
        for (std::size_t i = 0; i < compiled.size(); ++i) {
            const long params = match(compiled[i], method, segments);
            if (params < 0) continue;
            if (best == catalog.size() || params < best_params) {
                best = i;
                best_params = params;
            }
        }

        if (best == catalog.size()) {
            if (seen_uncatalogued.emplace(method, path, call.status).second) {
                report.uncatalogued.push_back(Call{method, path, call.status});
            }
            continue;
        }
        EntryCoverage& ec = report.entries[best];
        ec.hit = true;
        ++ec.calls;
        observed[best].insert(call.status);
    }

    report.operations_total = report.entries.size();
    for (std::size_t i = 0; i < report.entries.size(); ++i) {
        EntryCoverage& ec = report.entries[i];
        for (int status : ec.entry.statuses) {
            if (observed[i].count(status)) {
                ec.hit_statuses.push_back(status);
            }
            else {
                ec.missed_statuses.push_back(status);
            }
        }
        for (int status : observed[i]) {
            if (!std::binary_search(ec.entry.statuses.begin(), ec.entry.statuses.end(), status)) {
                ec.unexpected_statuses.push_back(status);
            }
        }
        if (ec.hit) ++report.operations_hit;
        report.statuses_total += ec.entry.statuses.size();
        report.statuses_hit += ec.hit_statuses.size();
    }
    return report;
}

std::vector<Call> collect_calls(const std::vector<Outcome>& outcomes) {
    std::vector<Call> calls;
    calls.reserve(outcomes.size());
    for (const auto& o : outcomes) {
        if (o.call) {
            calls.push_back(Call{o.call->method, o.call->path, o.call->status});
        }
    }
    return calls;
}

std::vector<Call> collect_calls(const RunResult& result) {
    return collect_calls(result.outcomes);
}

std::string Report::str() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "Operations: " << operations_hit << "/" << operations_total
        << " (" << operation_ratio() * 100.0 << "%), statuses: "
        << statuses_hit << "/" << statuses_total
        << " (" << status_ratio() * 100.0 << "%)\n";
    for (const auto& ec : entries) {
        oss << "  " << (ec.hit ? "[x] " : "[ ] ") << ec.entry.method << " " << ec.entry.path;
        if (!ec.missed_statuses.empty()) {
            oss << "  missed:";
            for (int s : ec.missed_statuses) oss << " " << s;
        }
        if (!ec.unexpected_statuses.empty()) {
            oss << "  unexpected:";
            for (int s : ec.unexpected_statuses) oss << " " << s;
        }
        oss << "\n";
    }
    for (const auto& call : uncatalogued) {
        oss << "  [?] " << call.method << " " << call.path << " -> " << call.status << " (uncatalogued)\n";
    }
    return oss.str();
}

} // namespace wirecheck::core::coverage
