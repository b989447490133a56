/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_FILE_HPP
#define CHAIN_MIRROR_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chain_mirror::file {
    extern std::string read(const std::string &path);
    extern void write(const std::string &path, std::string_view data);

    using path_list = std::vector<std::filesystem::path>;
    extern path_list files_with_ext(const std::string_view &dir, const std::string_view &ext);

    // Removes the file on destruction; used for scratch databases in tests and tools.
    struct tmp {
        explicit tmp(const std::string_view &name);
        ~tmp();

        const std::string &path() const
        {
            return _path;
        }

        operator const std::string &() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !CHAIN_MIRROR_FILE_HPP
