#pragma once

#include <map>
#include <mutex>
#include <string>

#include "LinkStore.h"

/**
 * @brief In-process LinkStore.
 *
 * Used by the test suite and as the fallback backend when no DATABASE_URL is
 * configured. One mutex makes each operation atomic, mirroring what the
 * database guarantees for MySqlLinkStore.
 */
class MemoryLinkStore : public LinkStore {
public:
    Link insert(const std::string& code, const std::string& target_url) override;
    std::optional<std::string> recordClick(const std::string& code) override;
    std::unique_ptr<Link> find(const std::string& code) override;
    std::vector<Link> findAll() override;
    bool erase(const std::string& code) override;

    // Current UTC time as YYYY-MM-DDTHH:MM:SS.ffffffZ, the format MySqlLinkStore reads back.
    static std::string getCurrentTimestamp();

private:
    struct Entry {
        Link link;
        unsigned long long sequence = 0;
    };

    std::map<std::string, Entry> links;
    unsigned long long nextSequence = 0;
    std::mutex linksMutex;
};
