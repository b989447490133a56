/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_DB_SQLITE_HPP
#define CHAIN_MIRROR_DB_SQLITE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <cm/error.hpp>

struct sqlite3;
struct sqlite3_stmt;

namespace chain_mirror::db {
    struct db_error: error {
        explicit db_error(const std::string &msg, const int code, const std::source_location &loc=std::source_location::current())
            : error { fmt::format("{} (sqlite code: {})", msg, code), loc }, _code { code }
        {
        }

        int code() const
        {
            return _code;
        }
    private:
        int _code;
    };

    struct statement;

    struct database {
        static constexpr std::string_view memory { ":memory:" };
        static constexpr int busy_timeout_ms = 5000;

        explicit database(const std::string &path);
        ~database();
        database(const database &) =delete;
        database &operator=(const database &) =delete;

        void exec(const std::string &sql);
        statement prepare(std::string_view sql);
        [[nodiscard]] int64_t last_insert_rowid() const;
        [[nodiscard]] size_t changes() const;
        [[nodiscard]] bool in_transaction() const;

        const std::string &path() const
        {
            return _path;
        }

        sqlite3 *handle()
        {
            return _db;
        }

        [[noreturn]] void throw_error(const std::string &context, int code, const std::source_location &loc=std::source_location::current()) const;
    private:
        std::string _path;
        sqlite3 *_db = nullptr;
    };

    // A prepared statement; the destructor finalizes it.
    struct statement {
        statement(database &db, std::string_view sql);
        statement(statement &&o) noexcept;
        statement(const statement &) =delete;
        ~statement();

        statement &bind(int pos, int v);
        statement &bind(int pos, int64_t v);
        statement &bind(int pos, uint64_t v);
        statement &bind(int pos, uint32_t v);
        statement &bind(int pos, bool v);
        statement &bind(int pos, std::string_view v);
        statement &bind(int pos, const char *v);
        statement &bind(int pos, const std::string &v);
        statement &bind(int pos, std::nullopt_t);

        template<typename T>
        statement &bind(const int pos, const std::optional<T> &v)
        {
            if (v)
                return bind(pos, *v);
            return bind(pos, std::nullopt);
        }

        // binds the arguments to positions 1..N
        template<typename ...Args>
        statement &bind_all(Args&&... a)
        {
            int pos = 0;
            (bind(++pos, std::forward<Args>(a)), ...);
            return *this;
        }

        // returns true when a row is available
        bool step();
        // runs a statement that returns no rows
        void exec();
        void reset();

        [[nodiscard]] bool is_null(int col) const;
        [[nodiscard]] int64_t column_int(int col) const;
        [[nodiscard]] uint64_t column_uint(int col) const;
        [[nodiscard]] bool column_bool(int col) const;
        [[nodiscard]] std::string column_text(int col) const;
        [[nodiscard]] std::optional<std::string> column_opt_text(int col) const;
        [[nodiscard]] std::optional<uint64_t> column_opt_uint(int col) const;
    private:
        database &_db;
        sqlite3_stmt *_stmt = nullptr;
    };

    // BEGIN IMMEDIATE on construction; rolls back on destruction unless committed.
    struct transaction {
        explicit transaction(database &db);
        ~transaction();
        transaction(const transaction &) =delete;

        void commit();
        void rollback();
    private:
        database &_db;
        bool _active = false;
    };
}

#endif // !CHAIN_MIRROR_DB_SQLITE_HPP
