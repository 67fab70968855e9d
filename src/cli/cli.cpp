// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "cli.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <iterator>
#include <ostream>
#include <set>

#ifndef IDGEN_VERSION
    #define IDGEN_VERSION "unknown"
#endif

using namespace idgen;
using namespace idgen::cli;

static auto is_hex_string(std::string_view value) noexcept -> bool {
    return std::all_of(value.begin(), value.end(), [](char c) {
        return impl::hex_alphabet.decode(c) < impl::hex_alphabet.size;
    });
}

void cli::setup_app(CLI::App & app, arguments & args) {
    app.require_subcommand(1);
    app.set_version_flag("--version", IDGEN_VERSION);

    app.add_option("-n,--num", args.count, "Number of identifiers to generate")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("--log-level", args.log_level, "Diagnostics level: trace, debug, info, warn, error, critical, off")
        ->envname("IDGEN_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->capture_default_str();

    auto * uuid_cmd = app.add_subcommand("uuid", "Generates a new Universally Unique Identifier");
    uuid_cmd->add_option("-v,--version", args.version, "UUID version: 1, 3, 4, 5, 6, 7 or 8")
        ->check(CLI::IsMember(std::set<unsigned>{1, 3, 4, 5, 6, 7, 8}))
        ->capture_default_str();
    uuid_cmd->add_option_function<std::string>("--timestamp", [&args](const std::string & val) { args.timestamp = val; },
        "Versions 1 and 6: 100ns ticks since 1582-10-15. Version 7: milliseconds since Unix epoch");
    uuid_cmd->add_option_function<std::string>("--namespace", [&args](const std::string & val) { args.ns = val; },
        "Versions 3 and 5: dns, url, oid, x500 or a UUID");
    uuid_cmd->add_option_function<std::string>("--name", [&args](const std::string & val) { args.name = val; },
        "Versions 3 and 5: the name to hash");
    uuid_cmd->add_option_function<std::string>("--node-id", [&args](const std::string & val) { args.node_id = val; },
        "Versions 1 and 6: MAC address to use as node id");
    uuid_cmd->add_option_function<std::string>("--data", [&args](const std::string & val) { args.data = val; },
        "Version 8: up to 32 hex digits of custom data");
    uuid_cmd->callback([&args]() { args.selected = command::uuid; });

    auto * ulid_cmd = app.add_subcommand("ulid", "Generates a new Universally Unique Lexicographically Sortable Identifier");
    ulid_cmd->add_option_function<std::string>("--timestamp", [&args](const std::string & val) { args.timestamp = val; },
        "Milliseconds since Unix epoch");
    ulid_cmd->callback([&args]() { args.selected = command::ulid; });

    auto * oid_cmd = app.add_subcommand("oid", "Generates a new MongoDB/BSON ObjectId");
    oid_cmd->alias("objectid");
    oid_cmd->add_option_function<std::string>("--timestamp", [&args](const std::string & val) { args.timestamp = val; },
        "Seconds since Unix epoch");
    oid_cmd->callback([&args]() { args.selected = command::object_id; });
}

auto cli::parse_timestamp(std::string_view value) -> uint64_t {
    uint64_t ret = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ret);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size())
        throw error(errc::invalid_timestamp, "'" + std::string(value) + "' is not a non-negative integer");
    return ret;
}

auto cli::parse_data(std::string_view value) -> std::vector<uint8_t> {
    if (value.empty())
        throw CLI::ValidationError("--data", "data must not be empty");
    if (!is_hex_string(value))
        throw CLI::ValidationError("--data", "data must contain only hex characters");

    std::vector<uint8_t> ret;
    ret.reserve((value.size() + 1) / 2);
    for (size_t i = 0; i < value.size(); i += 2) {
        char digits[2] = {value[i], i + 1 < value.size() ? value[i + 1] : '0'};
        uint8_t byte;
        impl::read_hex(digits, byte);
        ret.push_back(byte);
    }
    return ret;
}

auto cli::parse_node_id(std::string_view value) -> std::array<uint8_t, 6> {
    std::array<uint8_t, 6> ret;
    bool valid = (value.size() == 17);
    for (size_t i = 0; valid && i < ret.size(); ++i) {
        const char * group = value.data() + i * 3;
        if (i > 0 && group[-1] != ':' && group[-1] != '-')
            valid = false;
        else
            valid = impl::read_hex(group, ret[i]);
    }
    if (!valid)
        throw CLI::ValidationError("--node-id", "'" + std::string(value) + "' is not a MAC address like 01:23:45:67:89:ab");
    return ret;
}

auto cli::parse_namespace(std::string_view value) -> uuid {
    if (auto ret = uuid::namespaces::find(value))
        return *ret;
    if (auto ret = uuid::from_chars(value))
        return *ret;
    throw CLI::ValidationError("--namespace",
                               "unknown namespace '" + std::string(value) + "', expected dns, url, oid, x500 or a UUID");
}

auto cli::make_uuid_request(const arguments & args) -> uuid_request {
    const bool time_based = (args.version == 1 || args.version == 6);

    if (args.timestamp && !time_based && args.version != 7)
        throw CLI::ValidationError("--timestamp", fmt::format("--timestamp cannot be used with --version {}", args.version));
    if (args.node_id && !time_based)
        throw CLI::ValidationError("--node-id", fmt::format("--node-id cannot be used with --version {}", args.version));

    std::optional<uint64_t> timestamp;
    if (args.timestamp)
        timestamp = parse_timestamp(*args.timestamp);

    std::optional<std::array<uint8_t, 6>> node_id;
    if (args.node_id)
        node_id = parse_node_id(*args.node_id);

    auto name_based = [&]() {
        if (!args.ns)
            throw CLI::ValidationError("--namespace", fmt::format("--namespace is required for --version {}", args.version));
        if (!args.name)
            throw CLI::ValidationError("--name", fmt::format("--name is required for --version {}", args.version));
        return std::make_pair(parse_namespace(*args.ns), *args.name);
    };

    switch(args.version) {
        case 1:
            return time_based_request{timestamp, node_id};
        case 3: {
            auto [ns, name] = name_based();
            return md5_request{ns, name};
        }
        case 4:
            return random_request{};
        case 5: {
            auto [ns, name] = name_based();
            return sha1_request{ns, name};
        }
        case 6:
            return reordered_time_based_request{timestamp, node_id};
        case 7:
            return unix_time_based_request{timestamp};
        case 8:
            if (!args.data)
                throw CLI::ValidationError("--data", "--data is required for --version 8");
            return custom_request{parse_data(*args.data)};
    }
    throw CLI::ValidationError("--version", fmt::format("unsupported UUID version {}", args.version));
}

auto cli::generate(const arguments & args, random_source & random, clock_source & clock) -> std::string {
    std::string ret;
    auto out = std::back_inserter(ret);

    switch(args.selected) {
        case command::uuid: {
            auto request = make_uuid_request(args);
            spdlog::debug("generating {} version {} UUID(s)", args.count, unsigned(version_of(request)));
            uuid_generator generator(random, clock);
            for (size_t i = 0; i < args.count; ++i)
                fmt::format_to(out, "{}\n", generator.generate(request));
            break;
        }
        case command::ulid: {
            std::optional<uint64_t> timestamp;
            if (args.timestamp)
                timestamp = parse_timestamp(*args.timestamp);
            spdlog::debug("generating {} ULID(s)", args.count);
            ulid_generator generator(random, clock);
            for (const auto & id: generator.generate_batch(args.count, timestamp))
                fmt::format_to(out, "{}\n", id);
            break;
        }
        case command::object_id: {
            std::optional<uint64_t> timestamp;
            if (args.timestamp)
                timestamp = parse_timestamp(*args.timestamp);
            spdlog::debug("generating {} ObjectId(s)", args.count);
            object_id_generator generator(random, clock);
            for (size_t i = 0; i < args.count; ++i)
                fmt::format_to(out, "{}\n", generator.generate(timestamp));
            break;
        }
    }
    return ret;
}

void cli::configure_logging(std::string_view level, std::ostream & err) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(err, true);
    auto logger = std::make_shared<spdlog::logger>("idgen", std::move(sink));
    logger->set_pattern("%n: %l: %v");
    logger->set_level(spdlog::level::from_str(std::string(level)));
    spdlog::set_default_logger(std::move(logger));
}

auto cli::run(int argc, const char * const * argv, std::ostream & out, std::ostream & err) -> int {
    CLI::App app{"Generates unique identifiers: UUID, ULID and ObjectId", "idgen"};
    arguments args;
    setup_app(app, args);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError & e) {
        return app.exit(e, out, err);
    }

    configure_logging(args.log_level, err);

    try {
        auto text = generate(args);
        out << text;
        out.flush();
    } catch (const CLI::ParseError & e) {
        return app.exit(e, out, err);
    } catch (const std::exception & e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
