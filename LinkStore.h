#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Modals/Link.h"

/**
 * @brief Persistence seam under LinkRegistry.
 *
 * Every method is a single atomic store interaction. Implementations throw
 * ConflictError for a duplicate short code and StoreError for anything else
 * that goes wrong on the store side.
 */
class LinkStore {
public:
    virtual ~LinkStore() = default;

    // Persists {code, target_url, 0 clicks, now, null} and returns the stored row.
    virtual Link insert(const std::string& code, const std::string& target_url) = 0;

    // Increments total_clicks and stamps last_clicked in one step.
    // Returns the target URL, or nullopt when the code does not exist.
    virtual std::optional<std::string> recordClick(const std::string& code) = 0;

    virtual std::unique_ptr<Link> find(const std::string& code) = 0;

    // All links, newest first.
    virtual std::vector<Link> findAll() = 0;

    // True when a row was removed.
    virtual bool erase(const std::string& code) = 0;
};
