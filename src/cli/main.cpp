// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "cli.h"

#include <iostream>

int main(int argc, char ** argv)
{
    return idgen::cli::run(argc, argv, std::cout, std::cerr);
}
