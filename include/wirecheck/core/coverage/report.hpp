#pragma once

#include <cstddef>
#include <string>
#include <vector>


namespace wirecheck::core::coverage {

// Declared operation: method + path template + expected statuses
struct CatalogEntry {
    std::string method;
    std::string path;                 // "/users/{id}"
    std::vector<int> statuses;        // Expected response codes
};

using Catalog = std::vector<CatalogEntry>;

// Executed (method, path, status) tuple
struct Call {
    std::string method;
    std::string path;
    int status{0};
};

struct EntryCoverage {
    CatalogEntry entry;
    bool hit{false};
    std::vector<int> hit_statuses;         // Expected and observed
    std::vector<int> missed_statuses;      // Expected, never observed
    std::vector<int> unexpected_statuses;  // Observed, not declared
    std::size_t calls{0};
};

struct Report {
    std::vector<EntryCoverage> entries;    // Catalog order
    std::vector<Call> uncatalogued;        // Executed, matching no entry (deduplicated)

    std::size_t operations_total{0};
    std::size_t operations_hit{0};
    std::size_t statuses_total{0};
    std::size_t statuses_hit{0};

    [[nodiscard]]
    double operation_ratio() const noexcept {
        return operations_total ? static_cast<double>(operations_hit) / static_cast<double>(operations_total) : 0.0;
    }

    [[nodiscard]]
    double status_ratio() const noexcept {
        return statuses_total ? static_cast<double>(statuses_hit) / static_cast<double>(statuses_total) : 0.0;
    }

    [[nodiscard]] std::string str() const;
};

} // namespace wirecheck::core::coverage
