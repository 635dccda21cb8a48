// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "sqlite_checkpoint_store.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <sqlite3.h>
#include <memory>

namespace git_migrator {

namespace fs = boost::filesystem;
namespace pt = boost::posix_time;

namespace {

char const* const schema[] =
{
    "CREATE TABLE IF NOT EXISTS migration_state ("
    "  migration_id TEXT PRIMARY KEY,"
    "  last_commit TEXT,"
    "  processed INTEGER,"
    "  total INTEGER,"
    "  source_path TEXT,"
    "  target_path TEXT,"
    "  last_updated TEXT,"
    "  status TEXT"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_status ON migration_state(status)",
    "CREATE INDEX IF NOT EXISTS idx_last_updated ON migration_state(last_updated)"
};

char const* const select_columns =
    "SELECT migration_id, last_commit, processed, total,"
    " source_path, target_path, last_updated, status"
    " FROM migration_state";

struct sqlite_error : error
{
    sqlite_error(sqlite3* db, std::string const& what)
        : error(error_phase::state, what + ": " + sqlite3_errmsg(db)) {}
};

// A prepared statement, finalized on destruction
struct statement
{
    statement(sqlite3* db, std::string const& sql)
        : db(db), stmt(nullptr, sqlite3_finalize)
    {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
            throw sqlite_error(db, "cannot prepare '" + sql + "'");
        stmt.reset(raw);
    }

    statement& bind(int index, std::string const& text)
    {
        check(sqlite3_bind_text(stmt.get(), index, text.data(),
                                static_cast<int>(text.size()), SQLITE_TRANSIENT));
        return *this;
    }

    statement& bind(int index, std::size_t value)
    {
        check(sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(value)));
        return *this;
    }

    // True while rows remain
    bool step()
    {
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
            return true;
        if (rc != SQLITE_DONE)
            throw sqlite_error(db, "statement failed");
        return false;
    }

    std::string text(int column) const
    {
        unsigned char const* s = sqlite3_column_text(stmt.get(), column);
        return s ? std::string(reinterpret_cast<char const*>(s)) : std::string();
    }

    std::size_t size(int column) const
    {
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), column));
    }

 private:
    void check(int rc)
    {
        if (rc != SQLITE_OK)
            throw sqlite_error(db, "cannot bind parameter");
    }

    sqlite3* db;
    std::unique_ptr<sqlite3_stmt, int(*)(sqlite3_stmt*)> stmt;
};

std::string now_string()
{
    return pt::to_iso_extended_string(pt::microsec_clock::universal_time());
}

migration_state read_row(statement const& s)
{
    migration_state state;
    state.migration_id = s.text(0);
    state.last_commit = s.text(1);
    state.processed = s.size(2);
    state.total = s.size(3);
    state.source_path = s.text(4);
    state.target_path = s.text(5);
    std::string updated = s.text(6);
    if (!updated.empty())
    {
        try
        {
            state.last_updated = pt::from_iso_extended_string(updated);
        }
        catch (std::exception const&)
        {
            throw state_error("bad last_updated '" + updated + "' in checkpoint "
                              + state.migration_id);
        }
    }
    state.status = parse_migration_status(s.text(7));
    return state;
}

} // unnamed namespace

sqlite_checkpoint_store::sqlite_checkpoint_store(std::string const& path)
    : path_(path), db(nullptr)
{
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent);

    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK)
    {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw error(error_phase::state, "cannot open state database " + path + ": " + message);
    }

    try
    {
        sqlite3_busy_timeout(db, 5000);
        exec("PRAGMA journal_mode=DELETE");
        for (char const* sql : schema)
            exec(sql);
    }
    catch (...)
    {
        sqlite3_close(db);
        throw;
    }
    Log::trace() << "opened state database " << path << std::endl;
}

sqlite_checkpoint_store::~sqlite_checkpoint_store()
{
    sqlite3_close(db);
}

void sqlite_checkpoint_store::exec(char const* sql)
{
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK)
    {
        std::string text = message ? message : "unknown error";
        sqlite3_free(message);
        throw error(error_phase::state, std::string("cannot execute '") + sql + "': " + text);
    }
}

void sqlite_checkpoint_store::save(migration_state const& state)
{
    statement(db,
        "INSERT OR REPLACE INTO migration_state"
        " (migration_id, last_commit, processed, total,"
        "  source_path, target_path, last_updated, status)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?)")
        .bind(1, state.migration_id)
        .bind(2, state.last_commit)
        .bind(3, state.processed)
        .bind(4, state.total)
        .bind(5, state.source_path)
        .bind(6, state.target_path)
        .bind(7, now_string())
        .bind(8, std::string(to_string(state.status)))
        .step();
}

boost::optional<migration_state> sqlite_checkpoint_store::load(std::string const& migration_id)
{
    statement s(db, std::string(select_columns) + " WHERE migration_id = ?");
    s.bind(1, migration_id);
    if (!s.step())
        return boost::none;
    return read_row(s);
}

void sqlite_checkpoint_store::complete(std::string const& migration_id)
{
    statement(db,
        "UPDATE migration_state SET status = 'completed', last_updated = ?"
        " WHERE migration_id = ?")
        .bind(1, now_string())
        .bind(2, migration_id)
        .step();
}

void sqlite_checkpoint_store::remove(std::string const& migration_id)
{
    statement(db, "DELETE FROM migration_state WHERE migration_id = ?")
        .bind(1, migration_id)
        .step();
}

std::vector<migration_state> sqlite_checkpoint_store::history()
{
    std::vector<migration_state> result;
    statement s(db, std::string(select_columns) + " ORDER BY last_updated DESC");
    while (s.step())
        result.push_back(read_row(s));
    return result;
}

} // namespace git_migrator
