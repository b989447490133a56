/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_TEST_HPP
#define CHAIN_MIRROR_TEST_HPP

#define BOOST_UT_DISABLE_MODULE 1
#include <iostream>
#include <boost/ut.hpp>
#include <cm/error.hpp>
#include <cm/file.hpp>
#include <cm/logger.hpp>

namespace chain_mirror {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T, typename Y>
    void test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        expect(x == static_cast<T>(y), loc) << fmt::format("{} != {}", x, y);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<chain_mirror::test_printer>> {};

#endif // !CHAIN_MIRROR_TEST_HPP
