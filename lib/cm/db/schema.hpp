/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_DB_SCHEMA_HPP
#define CHAIN_MIRROR_DB_SCHEMA_HPP

#include <cm/db/sqlite.hpp>

namespace chain_mirror::db {
    static constexpr uint64_t schema_version = 1;

    // Creates the tables and views of the mirror if they do not exist yet.
    extern void create_schema(database &db);
    extern uint64_t stored_schema_version(database &db);
}

#endif // !CHAIN_MIRROR_DB_SCHEMA_HPP
