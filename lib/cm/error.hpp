/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_ERROR_HPP
#define CHAIN_MIRROR_ERROR_HPP

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <cm/format.hpp>
#include <cm/logger.hpp>

namespace chain_mirror {
    // A format string that remembers where it was written
    struct error_fmt {
        std::string_view fmt;
        std::source_location loc;

        error_fmt(const char *f, const std::source_location &l=std::source_location::current()):
            fmt { f }, loc { l }
        {
        }
    };

    struct error: std::runtime_error {
        explicit error(const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { formatted_msg {}, fmt::format("{} at {}", msg, loc) }
        {
        }

        explicit error(const std::string &msg, const std::exception &ex, const std::source_location &loc=std::source_location::current())
            : error { formatted_msg {}, fmt::format("{} at {} caused by {}: {}", msg, loc, typeid(ex).name(), ex.what()) }
        {
        }

        template<typename A0, typename ...Args>
        explicit error(const error_fmt &f, A0 &&a0, Args&&... a)
            : error { formatted_msg {}, fmt::format("{} at {}", fmt::format(fmt::runtime(f.fmt), std::forward<A0>(a0), std::forward<Args>(a)...), f.loc) }
        {
        }
    private:
        // a distinct tag so that a string literal never selects this constructor
        struct formatted_msg {};

        explicit error(formatted_msg, const std::string &msg): std::runtime_error { msg }
        {
            logger::debug("an exception created: {}", msg);
        }
    };

    struct error_sys: error {
        explicit error_sys(const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { fmt::format("{}, errno: {}, strerror: {}", msg, errno, std::strerror(errno)), loc }
        {
        }
    };

    // A failure of the upstream chain node: the current block or cycle is abandoned and retried later.
    struct chain_error: error {
        using error::error;
    };

    // Persisted state no longer satisfies the mirror's invariants; requires an operator.
    struct invariant_error: error {
        using error::error;
    };
}

#endif // !CHAIN_MIRROR_ERROR_HPP
