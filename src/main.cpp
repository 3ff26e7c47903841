#include "config/config_loader.hpp"
#include "core/json_codec.hpp"
#include "core/utils.hpp"
#include "security/connection_identity.hpp"
#include "vault/connection_registry.hpp"
#include "vault/credential_store.hpp"
#include "vault/vault_builder.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace credvault;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct CliArgs {
    std::string config_file;
    RequestContext ctx;
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

void print_usage() {
    std::cerr <<
        "Usage: credvault [--config FILE] [--session ID] [--ip ADDR] [--user-agent UA] <command>\n"
        "\n"
        "Commands:\n"
        "  save --host H --port P --database D --username U --engine E [--name N]\n"
        "                       secret is read from CREDVAULT_SECRET or the first stdin line\n"
        "  get <id>             show a credential (no secret)\n"
        "  secret <id>          print the decrypted secret\n"
        "  list                 list active credentials\n"
        "  connections          list credentials with connection status\n"
        "  delete <id>          soft-delete a credential\n"
        "  check --host H --port P --database D --username U --engine E\n"
        "                       look up an existing credential for an identity\n"
        "  audit [--credential ID] [--limit N]\n"
        "                       show the audit trail, newest first\n";
}

/// Splits global flags, the command, its --key value options and positionals
std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            const std::string value = argv[++i];
            const std::string key = arg.substr(2);
            if (key == "config")          args.config_file = value;
            else if (key == "session")    args.ctx.owner_session = value;
            else if (key == "ip")         args.ctx.ip_address = value;
            else if (key == "user-agent") args.ctx.user_agent = value;
            else                          args.options[key] = value;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    if (args.command.empty()) {
        return std::nullopt;
    }
    return args;
}

std::optional<int64_t> parse_id(const CliArgs& args) {
    if (args.positional.size() != 1) return std::nullopt;
    return utils::try_parse_int<int64_t>(args.positional.front());
}

/// Identity fields from --host/--port/--database/--username/--engine
std::optional<ConnectionIdentityFields> parse_identity(const CliArgs& args) {
    for (const char* key : {"host", "port", "database", "username", "engine"}) {
        if (!args.options.contains(key)) {
            std::cerr << std::format("Missing --{}\n", key);
            return std::nullopt;
        }
    }
    const auto port = utils::try_parse_int<uint16_t>(args.options.at("port"));
    if (!port) {
        std::cerr << std::format("Invalid --port '{}'\n", args.options.at("port"));
        return std::nullopt;
    }
    return ConnectionIdentityFields{args.options.at("host"), *port, args.options.at("database"),
                                    args.options.at("username"), args.options.at("engine")};
}

std::optional<std::string> read_secret() {
    if (const char* env = std::getenv("CREDVAULT_SECRET")) {
        return std::string(env);
    }
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void print_json(const nlohmann::json& j) {
    std::cout << json_codec::dump(j, 2) << "\n";
}

template<typename T>
int report_error(const Result<T>& result) {
    print_json({
        {"error", error_category_to_string(result.error_category())},
        {"message", result.error_message()},
    });
    return kExitError;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_save(VaultContext& vault, const CliArgs& args) {
    const auto identity = parse_identity(args);
    if (!identity) return kExitUsage;

    const auto secret = read_secret();
    if (!secret) {
        std::cerr << "No secret provided (set CREDVAULT_SECRET or pipe it on stdin)\n";
        return kExitUsage;
    }

    SaveRequest request;
    request.name = args.options.contains("name") ? args.options.at("name") : "";
    request.host = identity->host;
    request.port = identity->port;
    request.database = identity->database;
    request.username = identity->username;
    request.engine_type = identity->engine_type;
    request.secret = *secret;

    const auto result = vault.store->save(request, args.ctx);
    print_json(json_codec::save_result_to_json(result));
    return result.status == SaveStatus::ERROR ? kExitError : kExitOk;
}

int cmd_get(VaultContext& vault, const CliArgs& args) {
    const auto id = parse_id(args);
    if (!id) return kExitUsage;

    const auto result = vault.store->get(*id, args.ctx);
    if (result.is_error()) return report_error(result);
    print_json(json_codec::credential_to_json(result.value()));
    return kExitOk;
}

int cmd_secret(VaultContext& vault, const CliArgs& args) {
    const auto id = parse_id(args);
    if (!id) return kExitUsage;

    const auto result = vault.store->get_secret(*id, args.ctx);
    if (result.is_error()) return report_error(result);
    std::cout << result.value() << "\n";
    return kExitOk;
}

int cmd_list(VaultContext& vault, const CliArgs& args) {
    const auto result = vault.store->list(args.ctx.owner_session);
    if (result.is_error()) return report_error(result);

    auto out = nlohmann::json::array();
    for (const auto& credential : result.value()) {
        out.push_back(json_codec::credential_to_json(credential));
    }
    print_json(out);
    return kExitOk;
}

int cmd_connections(VaultContext& vault, const CliArgs& args) {
    const auto result = vault.registry->connections(args.ctx.owner_session);
    if (result.is_error()) return report_error(result);

    auto out = nlohmann::json::array();
    for (const auto& view : result.value()) {
        out.push_back(json_codec::connection_view_to_json(view));
    }
    print_json(out);
    return kExitOk;
}

int cmd_delete(VaultContext& vault, const CliArgs& args) {
    const auto id = parse_id(args);
    if (!id) return kExitUsage;

    const auto result = vault.store->remove(*id, args.ctx);
    if (result.is_error()) return report_error(result);
    print_json({{"id", *id}, {"deleted", result.value()}});
    return result.value() ? kExitOk : kExitError;
}

int cmd_check(VaultContext& vault, const CliArgs& args) {
    const auto identity = parse_identity(args);
    if (!identity) return kExitUsage;

    const auto result = vault.store->check_duplicate(*identity);
    if (result.is_error()) return report_error(result);

    nlohmann::json out = {
        {"connection_hash", ConnectionIdentity::fingerprint(*identity)},
        {"exists", result.value().has_value()},
    };
    out["credential"] = result.value()
        ? json_codec::credential_to_json(*result.value())
        : nlohmann::json(nullptr);
    print_json(out);
    return kExitOk;
}

int cmd_audit(VaultContext& vault, const CliArgs& args) {
    std::optional<int64_t> credential_id;
    std::optional<size_t> limit;
    if (const auto it = args.options.find("credential"); it != args.options.end()) {
        credential_id = utils::try_parse_int<int64_t>(it->second);
        if (!credential_id) return kExitUsage;
    }
    if (const auto it = args.options.find("limit"); it != args.options.end()) {
        limit = utils::try_parse_int<size_t>(it->second);
        if (!limit) return kExitUsage;
    }

    const auto result = vault.store->audit_trail(credential_id, limit);
    if (result.is_error()) return report_error(result);

    auto out = nlohmann::json::array();
    for (const auto& entry : result.value()) {
        out.push_back(json_codec::audit_entry_to_json(entry));
    }
    print_json(out);
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return kExitUsage;
    }

    VaultConfig config;
    if (!args->config_file.empty()) {
        auto loaded = ConfigLoader::load_from_file(args->config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitError;
        }
        config = std::move(loaded.config);
    }
    if (config.storage.backend == "memory") {
        utils::log::warn("Using the in-memory backend: nothing outlives this process");
    }

    VaultContext vault;
    try {
        vault = VaultBuilder(config).build();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Vault startup failed: {}", e.what()));
        return kExitError;
    }

    const std::map<std::string, int (*)(VaultContext&, const CliArgs&)> commands = {
        {"save", cmd_save},
        {"get", cmd_get},
        {"secret", cmd_secret},
        {"list", cmd_list},
        {"connections", cmd_connections},
        {"delete", cmd_delete},
        {"check", cmd_check},
        {"audit", cmd_audit},
    };

    const auto it = commands.find(args->command);
    if (it == commands.end()) {
        std::cerr << std::format("Unknown command '{}'\n", args->command);
        print_usage();
        return kExitUsage;
    }

    int rc = kExitError;
    try {
        rc = it->second(vault, *args);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Command '{}' failed: {}", args->command, e.what()));
        return kExitError;
    }
    if (rc == kExitUsage) {
        print_usage();
    }
    return rc;
}
