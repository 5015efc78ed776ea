#include "MySqlLinkStore.h"
#include "LinkErrors.h"
#include "Logger.h"

#include <fstream>
#include <sstream>

using std::string;
using std::unique_ptr;

namespace {

// Timestamps leave the database already in the wire format.
const string LINK_COLUMNS =
    "short_code, target_url, total_clicks, "
    "DATE_FORMAT(created_at, '%Y-%m-%dT%H:%i:%s.%fZ'), "
    "DATE_FORMAT(last_clicked, '%Y-%m-%dT%H:%i:%s.%fZ')";

const char* FILE_NAME = "MySqlLinkStore.cpp";
const char* CLASS_NAME = "MySqlLinkStore";

} // namespace

MySqlLinkStore::MySqlLinkStore(ConnectionPool& pool) : pool(pool) {}

Link MySqlLinkStore::rowToLink(mysqlx::Row& row) {
    Link link;
    link.short_code = row[0].get<string>();
    link.target_url = row[1].get<string>();
    link.total_clicks = row[2].get<uint64_t>();
    link.created_at = row[3].get<string>();
    if (!row[4].isNull()) {
        link.last_clicked = row[4].get<string>();
    }
    return link;
}

void MySqlLinkStore::rollbackQuietly(mysqlx::Session& session, const string& function) {
    try {
        session.rollback();
    } catch (const mysqlx::Error& e) {
        SaveLogs::log_warn(FILE_NAME, CLASS_NAME, function, string("Rollback failed: ") + e.what());
    }
}

void MySqlLinkStore::rethrow(PooledSession& session, const mysqlx::Error& e, const string& function) {
    string err_msg = e.what();
    session.markBroken();
    SaveLogs::log_error(FILE_NAME, CLASS_NAME, function, "DB_ERROR: " + err_msg);
    throw StoreError(err_msg);
}

std::vector<string> MySqlLinkStore::splitStatements(const string& sqlContent) {
    std::vector<string> statements;
    string current;
    std::istringstream lines(sqlContent);
    string line;

    auto flush = [&statements, &current] {
        current.erase(0, current.find_first_not_of(" \n\r\t"));
        current.erase(current.find_last_not_of(" \n\r\t") + 1);
        if (!current.empty()) {
            statements.push_back(current);
        }
        current.clear();
    };

    while (std::getline(lines, line)) {
        size_t comment_pos = line.find("--");
        if (comment_pos != string::npos) {
            line = line.substr(0, comment_pos);
        }
        for (char c : line) {
            if (c == ';') {
                flush();
            } else {
                current += c;
            }
        }
        current += ' ';
    }
    flush();
    return statements;
}

string MySqlLinkStore::listQuery() {
    return "SELECT " + LINK_COLUMNS + " FROM links ORDER BY created_at DESC, seq DESC";
}

bool MySqlLinkStore::setupDatabase(const string& schemaPath) {
    // 1. Read the schema file
    std::ifstream file(schemaPath);
    if (!file.is_open()) {
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, "setupDatabase", "Could not open " + schemaPath);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    // 2. Execute each statement
    try {
        PooledSession session = pool.acquire();
        try {
            for (const auto& stmt : splitStatements(buffer.str())) {
                session->sql(stmt).execute();
            }
        } catch (const mysqlx::Error& e) {
            session.markBroken();
            SaveLogs::log_error(FILE_NAME, CLASS_NAME, "setupDatabase", string("Schema setup failed: ") + e.what());
            return false;
        }
    } catch (const StoreError& e) {
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, "setupDatabase", e.what());
        return false;
    }

    SaveLogs::log_info(FILE_NAME, CLASS_NAME, "setupDatabase", "Schema setup completed successfully.");
    return true;
}

Link MySqlLinkStore::insert(const string& code, const string& target_url) {
    PooledSession session = pool.acquire();
    try {
        session->startTransaction();
        try {
            session->sql("INSERT INTO links (short_code, target_url, total_clicks, created_at) "
                         "VALUES (?, ?, 0, UTC_TIMESTAMP(6))")
                .bind(code)
                .bind(target_url)
                .execute();

            mysqlx::SqlResult result = session->sql("SELECT " + LINK_COLUMNS + " FROM links WHERE short_code = ?")
                                           .bind(code)
                                           .execute();
            mysqlx::Row row = result.fetchOne();
            if (!row) {
                throw StoreError("Inserted link '" + code + "' could not be read back.");
            }
            Link link = rowToLink(row);
            session->commit();
            return link;
        } catch (...) {
            rollbackQuietly(*session, "insert");
            throw;
        }
    } catch (const mysqlx::Error& e) {
        // The primary key on short_code is the only uniqueness check.
        if (string(e.what()).find("Duplicate entry") != string::npos) {
            throw ConflictError("Short code \"" + code + "\" already exists.");
        }
        rethrow(session, e, "insert");
    }
}

std::optional<string> MySqlLinkStore::recordClick(const string& code) {
    PooledSession session = pool.acquire();
    try {
        session->startTransaction();
        try {
            mysqlx::SqlResult updated = session->sql("UPDATE links "
                                                     "SET total_clicks = total_clicks + 1, "
                                                     "last_clicked = UTC_TIMESTAMP(6) "
                                                     "WHERE short_code = ?")
                                            .bind(code)
                                            .execute();
            if (updated.getAffectedItemsCount() == 0) {
                session->rollback();
                return std::nullopt;
            }

            // The UPDATE holds the row lock, so the URL read here belongs to the counted click.
            mysqlx::SqlResult result = session->sql("SELECT target_url FROM links WHERE short_code = ?")
                                           .bind(code)
                                           .execute();
            mysqlx::Row row = result.fetchOne();
            if (!row) {
                throw StoreError("Clicked link '" + code + "' vanished inside its transaction.");
            }
            string target = row[0].get<string>();
            session->commit();
            return target;
        } catch (...) {
            rollbackQuietly(*session, "recordClick");
            throw;
        }
    } catch (const mysqlx::Error& e) {
        rethrow(session, e, "recordClick");
    }
}

unique_ptr<Link> MySqlLinkStore::find(const string& code) {
    PooledSession session = pool.acquire();
    try {
        mysqlx::SqlResult result = session->sql("SELECT " + LINK_COLUMNS + " FROM links WHERE short_code = ?")
                                       .bind(code)
                                       .execute();
        mysqlx::Row row = result.fetchOne();
        if (!row) {
            return nullptr;
        }
        return std::make_unique<Link>(rowToLink(row));
    } catch (const mysqlx::Error& e) {
        rethrow(session, e, "find");
    }
}

std::vector<Link> MySqlLinkStore::findAll() {
    PooledSession session = pool.acquire();
    try {
        mysqlx::SqlResult result = session->sql(listQuery()).execute();
        std::vector<Link> links;
        for (mysqlx::Row row : result) {
            links.push_back(rowToLink(row));
        }
        return links;
    } catch (const mysqlx::Error& e) {
        rethrow(session, e, "findAll");
    }
}

bool MySqlLinkStore::erase(const string& code) {
    PooledSession session = pool.acquire();
    try {
        mysqlx::SqlResult result = session->sql("DELETE FROM links WHERE short_code = ?")
                                       .bind(code)
                                       .execute();
        return result.getAffectedItemsCount() > 0;
    } catch (const mysqlx::Error& e) {
        rethrow(session, e, "erase");
    }
}
