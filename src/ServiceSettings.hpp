/**
 * @file ServiceSettings.hpp
 * @brief Settings aggregate managed by stringly-cli
 */

#ifndef STRINGLY_SERVICE_SETTINGS_HPP
#define STRINGLY_SERVICE_SETTINGS_HPP

#include "stringly/Reflect.hpp"

#include <cstdint>
#include <string>
#include <tuple>

namespace stringly::cli {

struct Endpoint {
    std::string host = "127.0.0.1";
    std::int64_t port = 8080;
};

struct Limits {
    double timeout_seconds = 30.0;
    std::int64_t max_connections = 256;
};

struct Server {
    Endpoint listen;
    Limits limits;
};

struct ServiceSettings {
    std::string name = "stringly-service";
    Server server;
    double sample_rate = 0.25;
};

} // namespace stringly::cli

namespace stringly {

template <>
struct Reflect<cli::Endpoint> {
    static constexpr const char* name = "Endpoint";
    static constexpr auto fields() {
        return std::make_tuple(field("host", &cli::Endpoint::host),
                               field("port", &cli::Endpoint::port));
    }
};

template <>
struct Reflect<cli::Limits> {
    static constexpr const char* name = "Limits";
    static constexpr auto fields() {
        return std::make_tuple(field("timeout_seconds", &cli::Limits::timeout_seconds),
                               field("max_connections", &cli::Limits::max_connections));
    }
};

template <>
struct Reflect<cli::Server> {
    static constexpr const char* name = "Server";
    static constexpr auto fields() {
        return std::make_tuple(field("listen", &cli::Server::listen),
                               field("limits", &cli::Server::limits));
    }
};

template <>
struct Reflect<cli::ServiceSettings> {
    static constexpr const char* name = "ServiceSettings";
    static constexpr auto fields() {
        return std::make_tuple(field("name", &cli::ServiceSettings::name),
                               field("server", &cli::ServiceSettings::server),
                               field("sample_rate", &cli::ServiceSettings::sample_rate));
    }
};

} // namespace stringly

#endif // STRINGLY_SERVICE_SETTINGS_HPP
