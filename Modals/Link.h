#pragma once

#include <string>
#include <optional>

struct Link {
    std::string short_code;
    std::string target_url;
    unsigned long long total_clicks = 0;
    std::string created_at;                  // ISO-8601 UTC, microsecond precision
    std::optional<std::string> last_clicked; // empty until the first redirect
};
