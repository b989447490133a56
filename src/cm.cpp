/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace chain_mirror;
    consider_bin_dir(argv[0]);
    return cli::run(argc, argv);
}
