/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <cm/error.hpp>
#include <cm/file.hpp>

namespace chain_mirror::file {
    std::string read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        std::ostringstream ss {};
        ss << is.rdbuf();
        if (is.bad())
            throw error_sys(fmt::format("failed to read {}", path));
        return ss.str();
    }

    void write(const std::string &path, const std::string_view data)
    {
        const auto dir = std::filesystem::path { path }.parent_path();
        if (!dir.empty())
            std::filesystem::create_directories(dir);
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open {} for writing", path));
        os.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!os)
            throw error_sys(fmt::format("failed to write {}", path));
    }

    path_list files_with_ext(const std::string_view &dir, const std::string_view &ext)
    {
        path_list paths {};
        for (auto &entry: std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext)
                paths.emplace_back(entry.path());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    tmp::tmp(const std::string_view &name):
        _path { (std::filesystem::temp_directory_path() / fmt::format("cm-{}-{}", getpid(), name)).string() }
    {
        std::filesystem::remove(_path);
    }

    tmp::~tmp()
    {
        // sqlite may leave its journal files next to the database
        for (const std::string_view suffix: { "", "-journal", "-wal", "-shm" }) {
            const auto path = fmt::format("{}{}", _path, suffix);
            std::error_code ec {};
            if (!std::filesystem::remove(path, ec) && ec)
                logger::warn("failed to remove a temporary file {}: {}", path, ec.message());
        }
    }
}
