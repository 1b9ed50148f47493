/// @file main.cpp
/// @brief cas_authctl: operator tool for credential hashes and tokens.
///
/// Usage:
///   cas_authctl [--config <path>] hash              (secret read from stdin)
///   cas_authctl [--config <path>] issue <subject>
///   cas_authctl [--config <path>] validate <token>

#include "cas/foundation/auth_logger.hpp"
#include "cas/foundation/config_manager.hpp"
#include "cas/service/auth_config.hpp"
#include "cas/service/auth_types.hpp"
#include "cas/service/config_loader.hpp"
#include "cas/service/credential_hasher.hpp"
#include "cas/service/token_codec.hpp"
#include "cas/version.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

using cas::foundation::errorCodeName;

void printUsage(std::ostream& out) {
    out << "cas_authctl " << cas::Version::string << "\n"
        << "usage: cas_authctl [--config <path>] <command>\n"
        << "  hash               hash a secret read from stdin\n"
        << "  issue <subject>    issue an access token\n"
        << "  validate <token>   validate a token and print its claims\n";
}

/// Positional arguments with "--config <path>" removed.
std::vector<std::string_view> positionalArgs(int argc, char* argv[]) {
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            ++i;
            continue;
        }
        args.push_back(arg);
    }
    return args;
}

int reportError(const cas::foundation::AuthError& error) {
    std::cerr << "error: " << errorCodeName(error.code()) << ": " << error.message() << "\n";
    return EXIT_FAILURE;
}

void printClaimValue(const cas::service::ClaimValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        std::cout << *s;
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        std::cout << *i;
    } else {
        std::cout << (std::get<bool>(value) ? "true" : "false");
    }
}

int runHash(const cas::service::AuthConfig& config) {
    std::string secret;
    if (!std::getline(std::cin, secret) || secret.empty()) {
        std::cerr << "error: no secret on stdin\n";
        return EXIT_FAILURE;
    }
    cas::service::CredentialHasher hasher(config.hashIterations);
    auto hashed = hasher.hash(secret);
    if (!hashed) {
        return reportError(hashed.error());
    }
    std::cout << hashed.value() << "\n";
    return EXIT_SUCCESS;
}

int runIssue(const cas::service::AuthConfig& config, std::string_view subject) {
    cas::service::TokenCodec codec(config);
    cas::service::TokenClaims claims;
    claims.subject = std::string(subject);
    auto token = codec.issue(claims, config.tokenTtl);
    if (!token) {
        return reportError(token.error());
    }
    std::cout << token.value() << "\n";
    return EXIT_SUCCESS;
}

int runValidate(const cas::service::AuthConfig& config, std::string_view token) {
    cas::service::TokenCodec codec(config);
    auto claims = codec.validate(token);
    if (!claims) {
        return reportError(claims.error());
    }
    const auto& c = claims.value();
    auto epoch = [](std::chrono::system_clock::time_point tp) {
        return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
    };
    std::cout << "alg: " << c.algorithm << "\n"
              << "sub: " << c.subject << "\n"
              << "iat: " << epoch(c.issuedAt) << "\n"
              << "exp: " << epoch(c.expiresAt) << "\n"
              << "jti: " << c.tokenId << "\n";
    for (const auto& [name, value] : c.extensions) {
        std::cout << name << ": ";
        printClaimValue(value);
        std::cout << "\n";
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = positionalArgs(argc, argv);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage(args.empty() ? std::cerr : std::cout);
        return args.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    // Resolve config path: --config flag > CAS_CONFIG_PATH env > default.
    auto configPath = cas::service::parseConfigArg(argc, argv);

    cas::foundation::ConfigManager config;
    auto loadResult = configPath.empty()
        ? cas::service::loadConfig(config, cas::service::kDefaultConfigPath)
        : config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto authConfig = cas::service::loadAuthConfig(config);
    if (!authConfig) {
        return reportError(authConfig.error());
    }

    const auto command = args[0];
    if (command == "hash" && args.size() == 1) {
        return runHash(authConfig.value());
    }

    if (auto valid = cas::service::validateAuthConfig(authConfig.value()); !valid) {
        return reportError(valid.error());
    }
    if (command == "issue" && args.size() == 2) {
        return runIssue(authConfig.value(), args[1]);
    }
    if (command == "validate" && args.size() == 2) {
        return runValidate(authConfig.value(), args[1]);
    }

    printUsage(std::cerr);
    return EXIT_FAILURE;
}
