/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <filesystem>
#include <limits>
#include <sqlite3.h>
#include <cm/db/sqlite.hpp>

namespace chain_mirror::db {
    database::database(const std::string &path): _path { path }
    {
        if (_path != memory) {
            if (const auto dir = std::filesystem::path { _path }.parent_path(); !dir.empty())
                std::filesystem::create_directories(dir);
        }
        if (const auto rc = sqlite3_open_v2(_path.c_str(), &_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr); rc != SQLITE_OK) {
            const std::string msg { _db ? sqlite3_errmsg(_db) : sqlite3_errstr(rc) };
            sqlite3_close(_db);
            _db = nullptr;
            throw db_error(fmt::format("failed to open {}: {}", _path, msg), rc);
        }
        sqlite3_extended_result_codes(_db, 1);
        sqlite3_busy_timeout(_db, busy_timeout_ms);
        if (_path != memory)
            exec("PRAGMA journal_mode=WAL");
        logger::debug("opened sqlite database {}", _path);
    }

    database::~database()
    {
        if (_db) {
            if (const auto rc = sqlite3_close(_db); rc != SQLITE_OK)
                logger::error("failed to close {}: {}", _path, sqlite3_errstr(rc));
            _db = nullptr;
        }
    }

    void database::throw_error(const std::string &context, const int code, const std::source_location &loc) const
    {
        throw db_error(fmt::format("{}: {}", context, sqlite3_errmsg(_db)), code, loc);
    }

    void database::exec(const std::string &sql)
    {
        char *err_msg = nullptr;
        if (const auto rc = sqlite3_exec(_db, sql.c_str(), nullptr, nullptr, &err_msg); rc != SQLITE_OK) {
            const std::string msg { err_msg ? err_msg : sqlite3_errstr(rc) };
            sqlite3_free(err_msg);
            throw db_error(fmt::format("{} failed: {}", sql, msg), rc);
        }
    }

    statement database::prepare(const std::string_view sql)
    {
        return statement { *this, sql };
    }

    int64_t database::last_insert_rowid() const
    {
        return sqlite3_last_insert_rowid(_db);
    }

    size_t database::changes() const
    {
        return static_cast<size_t>(sqlite3_changes(_db));
    }

    bool database::in_transaction() const
    {
        return sqlite3_get_autocommit(_db) == 0;
    }

    statement::statement(database &db, const std::string_view sql): _db { db }
    {
        if (const auto rc = sqlite3_prepare_v2(_db.handle(), sql.data(), static_cast<int>(sql.size()), &_stmt, nullptr); rc != SQLITE_OK)
            _db.throw_error(fmt::format("prepare of '{}'", sql), rc);
    }

    statement::statement(statement &&o) noexcept: _db { o._db }, _stmt { o._stmt }
    {
        o._stmt = nullptr;
    }

    statement::~statement()
    {
        if (_stmt)
            sqlite3_finalize(_stmt);
    }

    statement &statement::bind(const int pos, const int v)
    {
        return bind(pos, static_cast<int64_t>(v));
    }

    statement &statement::bind(const int pos, const int64_t v)
    {
        if (const auto rc = sqlite3_bind_int64(_stmt, pos, v); rc != SQLITE_OK)
            _db.throw_error(fmt::format("bind of parameter #{}", pos), rc);
        return *this;
    }

    statement &statement::bind(const int pos, const uint64_t v)
    {
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw error("value {} of parameter #{} does not fit into an sqlite integer", v, pos);
        return bind(pos, static_cast<int64_t>(v));
    }

    statement &statement::bind(const int pos, const uint32_t v)
    {
        return bind(pos, static_cast<int64_t>(v));
    }

    statement &statement::bind(const int pos, const bool v)
    {
        return bind(pos, static_cast<int64_t>(v ? 1 : 0));
    }

    statement &statement::bind(const int pos, const std::string_view v)
    {
        if (const auto rc = sqlite3_bind_text(_stmt, pos, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT); rc != SQLITE_OK)
            _db.throw_error(fmt::format("bind of parameter #{}", pos), rc);
        return *this;
    }

    statement &statement::bind(const int pos, const char *v)
    {
        return bind(pos, std::string_view { v });
    }

    statement &statement::bind(const int pos, const std::string &v)
    {
        return bind(pos, std::string_view { v });
    }

    statement &statement::bind(const int pos, std::nullopt_t)
    {
        if (const auto rc = sqlite3_bind_null(_stmt, pos); rc != SQLITE_OK)
            _db.throw_error(fmt::format("bind of parameter #{}", pos), rc);
        return *this;
    }

    bool statement::step()
    {
        switch (const auto rc = sqlite3_step(_stmt); rc) {
            case SQLITE_ROW:
                return true;
            case SQLITE_DONE:
                return false;
            default:
                _db.throw_error(fmt::format("step of '{}'", sqlite3_sql(_stmt)), rc);
        }
    }

    void statement::exec()
    {
        while (step()) {
        }
    }

    void statement::reset()
    {
        sqlite3_reset(_stmt);
        sqlite3_clear_bindings(_stmt);
    }

    bool statement::is_null(const int col) const
    {
        return sqlite3_column_type(_stmt, col) == SQLITE_NULL;
    }

    int64_t statement::column_int(const int col) const
    {
        return sqlite3_column_int64(_stmt, col);
    }

    uint64_t statement::column_uint(const int col) const
    {
        const auto v = sqlite3_column_int64(_stmt, col);
        if (v < 0)
            throw error("column #{} contains a negative value {} where an unsigned one is expected", col, v);
        return static_cast<uint64_t>(v);
    }

    bool statement::column_bool(const int col) const
    {
        return sqlite3_column_int64(_stmt, col) != 0;
    }

    std::string statement::column_text(const int col) const
    {
        const auto *data = sqlite3_column_text(_stmt, col);
        if (!data)
            return {};
        return std::string { reinterpret_cast<const char *>(data), static_cast<size_t>(sqlite3_column_bytes(_stmt, col)) };
    }

    std::optional<std::string> statement::column_opt_text(const int col) const
    {
        if (is_null(col))
            return {};
        return column_text(col);
    }

    std::optional<uint64_t> statement::column_opt_uint(const int col) const
    {
        if (is_null(col))
            return {};
        return column_uint(col);
    }

    transaction::transaction(database &db): _db { db }
    {
        _db.exec("BEGIN IMMEDIATE");
        _active = true;
    }

    transaction::~transaction()
    {
        if (_active) {
            logger::run_log_errors([&] {
                rollback();
            });
        }
    }

    void transaction::commit()
    {
        if (!_active)
            throw error("commit of an inactive transaction!");
        _db.exec("COMMIT");
        _active = false;
    }

    void transaction::rollback()
    {
        if (!_active)
            throw error("rollback of an inactive transaction!");
        _active = false;
        _db.exec("ROLLBACK");
        logger::debug("rolled back a transaction on {}", _db.path());
    }
}
