#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "LinkStore.h"
#include "Modals/Link.h"

/**
 * @brief Rules for code allocation, uniqueness, click accounting and deletion.
 *
 * Stateless apart from the store reference, so one instance is shared by all
 * request threads. Every operation maps to exactly one LinkStore call and is
 * never retried; failures surface as the LinkError subclasses in LinkErrors.h.
 */
class LinkRegistry {
public:
    using CodeGenerator = std::function<std::string()>;

    static constexpr size_t GENERATED_CODE_LENGTH = 7;

    // An empty generator selects generateShortCode().
    explicit LinkRegistry(LinkStore& store, CodeGenerator generator = nullptr);

    /**
     * @brief Creates a link.
     * @param target_url Required, must be non-empty.
     * @param short_code Optional; nullopt or "" mean absent. Anything else is trimmed and must match the code pattern.
     * @throws ValidationError on empty target_url or malformed short_code.
     * @throws ConflictError if the code is taken, generated codes included.
     * @throws StoreError on datastore failure.
     */
    Link create(const std::string& target_url, const std::optional<std::string>& short_code = std::nullopt);

    // Records one click and returns the target URL. Throws NotFoundError for unknown codes.
    std::string redirect(const std::string& code);

    // Read-only lookup. Throws NotFoundError for unknown codes.
    Link get(const std::string& code);

    // Newest first.
    std::vector<Link> list();

    // Throws NotFoundError for unknown codes.
    bool remove(const std::string& code);

    // Matches ^[A-Za-z0-9]{6,8}$
    static bool isValidShortCode(const std::string& code);

    static std::string generateShortCode(size_t length = GENERATED_CODE_LENGTH);

private:
    LinkStore& store;
    CodeGenerator generator;

    static std::string trim(const std::string& value);
};
