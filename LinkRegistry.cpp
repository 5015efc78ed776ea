#include "LinkRegistry.h"
#include "LinkErrors.h"

#include <random>
#include <regex>
#include <utility>

using std::string;

namespace {

const std::regex CODE_REGEX("^[A-Za-z0-9]{6,8}$");

} // namespace

LinkRegistry::LinkRegistry(LinkStore& store, CodeGenerator generator)
    : store(store), generator(std::move(generator)) {
    if (!this->generator) {
        this->generator = [] { return generateShortCode(); };
    }
}

bool LinkRegistry::isValidShortCode(const string& code) {
    return std::regex_match(code, CODE_REGEX);
}

// Draws `length` characters independently from the 62-character alphabet.
string LinkRegistry::generateShortCode(size_t length) {
    static const string CHARACTERS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 engine(std::random_device{}());
    std::uniform_int_distribution<size_t> distribution(0, CHARACTERS.size() - 1);

    string random_string;
    random_string.reserve(length);
    for (size_t i = 0; i < length; ++i)
        random_string += CHARACTERS[distribution(engine)];
    return random_string;
}

string LinkRegistry::trim(const string& value) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = value.find_first_not_of(whitespace);
    if (start == string::npos) return "";
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

Link LinkRegistry::create(const string& target_url, const std::optional<string>& short_code) {
    if (target_url.empty()) {
        throw ValidationError("Target URL is required.");
    }

    string code;
    if (!short_code || short_code->empty()) {
        // No pre-check: a collision is reported by the store like any other duplicate.
        code = generator();
    } else {
        // A value that trims to "" was still supplied, so it is validated, not generated.
        code = trim(*short_code);
        if (!isValidShortCode(code)) {
            throw ValidationError("Short code must be 6 to 8 alphanumeric characters.");
        }
    }

    return store.insert(code, target_url);
}

string LinkRegistry::redirect(const string& code) {
    if (!isValidShortCode(code)) {
        throw NotFoundError("Link not found.");
    }
    std::optional<string> target = store.recordClick(code);
    if (!target) {
        throw NotFoundError("Link not found.");
    }
    return *target;
}

Link LinkRegistry::get(const string& code) {
    if (!isValidShortCode(code)) {
        throw NotFoundError("Link not found.");
    }
    std::unique_ptr<Link> link = store.find(code);
    if (!link) {
        throw NotFoundError("Link not found.");
    }
    return *link;
}

std::vector<Link> LinkRegistry::list() {
    return store.findAll();
}

bool LinkRegistry::remove(const string& code) {
    if (!isValidShortCode(code) || !store.erase(code)) {
        throw NotFoundError("Link not found or already deleted.");
    }
    return true;
}
