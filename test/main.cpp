// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

int main(int argc, char ** argv)
{
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("idgen", std::make_shared<spdlog::sinks::null_sink_mt>()));

    return doctest::Context(argc, argv).run();
}
