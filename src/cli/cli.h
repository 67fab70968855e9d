// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_IDGEN_CLI_H_INCLUDED
#define HEADER_IDGEN_CLI_H_INCLUDED

#include <fmt/format.h>

#include <idgen/uuid.h>
#include <idgen/ulid.h>
#include <idgen/object_id.h>

#include <CLI/CLI.hpp>

#include <iosfwd>

namespace idgen::cli {

    enum class command {
        uuid,
        ulid,
        object_id
    };

    /// Raw command line values, validated by make_uuid_request() and friends
    struct arguments {
        size_t count = 1;
        std::string log_level = "warn";
        command selected = command::uuid;

        unsigned version = 4;
        std::optional<std::string> timestamp;
        std::optional<std::string> ns;
        std::optional<std::string> name;
        std::optional<std::string> node_id;
        std::optional<std::string> data;
    };

    /// Registers all options and subcommands of the tool on app
    void setup_app(CLI::App & app, arguments & args);

    /// Parses a non-negative decimal timestamp. Throws error with errc::invalid_timestamp.
    auto parse_timestamp(std::string_view value) -> uint64_t;

    /**
     * Parses hex payload of a custom UUID.
     *
     * An odd number of digits is padded with a trailing zero. The result may be
     * longer than 16 bytes; the generator rejects it in that case.
     */
    auto parse_data(std::string_view value) -> std::vector<uint8_t>;

    /// Parses a MAC address in `xx:xx:xx:xx:xx:xx` or `xx-xx-xx-xx-xx-xx` form
    auto parse_node_id(std::string_view value) -> std::array<uint8_t, 6>;

    /// Resolves a well-known namespace name or a UUID string
    auto parse_namespace(std::string_view value) -> uuid;

    /// Validates uuid subcommand options and builds the generator request
    auto make_uuid_request(const arguments & args) -> uuid_request;

    /**
     * Generates all requested identifiers, one per line.
     *
     * Nothing is returned unless every identifier was generated.
     */
    auto generate(const arguments & args,
                  random_source & random = random_source::system(),
                  clock_source & clock = clock_source::system()) -> std::string;

    /// Routes the default spdlog logger to err at the given level
    void configure_logging(std::string_view level, std::ostream & err);

    /// Runs the tool. Returns the process exit code.
    auto run(int argc, const char * const * argv, std::ostream & out, std::ostream & err) -> int;
}

#endif
