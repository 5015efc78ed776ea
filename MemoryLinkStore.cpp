#include "MemoryLinkStore.h"
#include "LinkErrors.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

using std::string;
using std::lock_guard;
using std::mutex;

string MemoryLinkStore::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    time_t seconds = std::chrono::system_clock::to_time_t(now);

    struct tm utc{};
    gmtime_r(&seconds, &utc);
    char date[20]; // YYYY-MM-DDTHH:MM:SS\0
    strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s.%06lldZ", date, static_cast<long long>(micros));
    return buffer;
}

Link MemoryLinkStore::insert(const string& code, const string& target_url) {
    lock_guard<mutex> lock(linksMutex);
    if (links.count(code)) {
        throw ConflictError("Short code \"" + code + "\" already exists.");
    }

    Entry entry;
    entry.link.short_code = code;
    entry.link.target_url = target_url;
    entry.link.total_clicks = 0;
    entry.link.created_at = getCurrentTimestamp();
    entry.sequence = nextSequence++;

    Link stored = entry.link;
    links.emplace(code, std::move(entry));
    return stored;
}

std::optional<string> MemoryLinkStore::recordClick(const string& code) {
    lock_guard<mutex> lock(linksMutex);
    auto it = links.find(code);
    if (it == links.end()) {
        return std::nullopt;
    }
    Link& link = it->second.link;
    link.total_clicks += 1;
    link.last_clicked = getCurrentTimestamp();
    return link.target_url;
}

std::unique_ptr<Link> MemoryLinkStore::find(const string& code) {
    lock_guard<mutex> lock(linksMutex);
    auto it = links.find(code);
    if (it == links.end()) {
        return nullptr;
    }
    return std::make_unique<Link>(it->second.link);
}

std::vector<Link> MemoryLinkStore::findAll() {
    std::vector<const Entry*> entries;
    std::vector<Link> result;

    lock_guard<mutex> lock(linksMutex);
    entries.reserve(links.size());
    for (const auto& kv : links) {
        entries.push_back(&kv.second);
    }

    // Newest first; the insertion sequence breaks timestamp ties.
    std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
        if (a->link.created_at != b->link.created_at) {
            return a->link.created_at > b->link.created_at;
        }
        return a->sequence > b->sequence;
    });

    result.reserve(entries.size());
    for (const Entry* entry : entries) {
        result.push_back(entry->link);
    }
    return result;
}

bool MemoryLinkStore::erase(const string& code) {
    lock_guard<mutex> lock(linksMutex);
    return links.erase(code) > 0;
}
