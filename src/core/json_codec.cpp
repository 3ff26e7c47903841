#include "core/json_codec.hpp"
#include "core/utils.hpp"

namespace credvault::json_codec {

namespace {

template<typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // anonymous namespace

std::string dump(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json credential_to_json(const Credential& credential) {
    return {
        {"id", credential.id},
        {"connection_hash", credential.connection_hash},
        {"name", credential.name},
        {"host", credential.host},
        {"port", credential.port},
        {"database", credential.database},
        {"username", credential.username},
        {"engine_type", credential.engine_type},
        {"created_at", utils::format_timestamp(credential.created_at)},
        {"updated_at", utils::format_timestamp(credential.updated_at)},
        {"last_used", utils::format_timestamp(credential.last_used)},
        {"owner_session", optional_to_json(credential.owner_session)},
        {"is_active", credential.is_active},
        {"has_credentials", !credential.encrypted_secret.empty()},
    };
}

nlohmann::json save_result_to_json(const SaveResult& result) {
    nlohmann::json out = {
        {"status", save_status_to_string(result.status)},
        {"message", result.message},
        {"duplicate", result.is_duplicate},
    };
    out["credential"] = result.credential
        ? credential_to_json(*result.credential)
        : nlohmann::json(nullptr);
    return out;
}

nlohmann::json audit_entry_to_json(const AuditEntry& entry) {
    nlohmann::json out = {
        {"id", entry.id},
        {"credential_id", optional_to_json(entry.credential_id)},
        {"connection_hash", entry.connection_hash},
        {"operation", audit_operation_to_string(entry.operation)},
        {"success", entry.success},
        {"error_message", optional_to_json(entry.error_message)},
        {"owner_session", optional_to_json(entry.owner_session)},
        {"ip_address", optional_to_json(entry.ip_address)},
        {"user_agent", optional_to_json(entry.user_agent)},
        {"timestamp", utils::format_timestamp(entry.timestamp)},
    };
    out["metadata"] = entry.metadata.empty()
        ? nlohmann::json(nullptr)
        : nlohmann::json(entry.metadata);
    return out;
}

nlohmann::json connection_view_to_json(const ConnectionView& view) {
    const auto& c = view.credential;
    return {
        {"id", std::to_string(c.id)},
        {"name", c.name},
        {"config", {
            {"host", c.host},
            {"port", std::to_string(c.port)},
            {"database", c.database},
            {"username", c.username},
            {"password", view.secret.value_or("")},
        }},
        {"type", c.engine_type},
        {"status", view.connected ? "connected" : "disconnected"},
        {"lastConnected", utils::format_timestamp(c.last_used)},
        {"createdAt", utils::format_timestamp(c.created_at)},
        {"hasSecureCredentials", true},
    };
}

std::string metadata_to_string(const std::map<std::string, std::string>& metadata) {
    if (metadata.empty()) return {};
    return dump(nlohmann::json(metadata));
}

std::map<std::string, std::string> metadata_from_string(const std::string& text) {
    std::map<std::string, std::string> result;
    if (text.empty()) return result;

    const auto parsed = nlohmann::json::parse(text);
    if (!parsed.is_object()) return result;

    for (const auto& [key, value] : parsed.items()) {
        result[key] = value.is_string() ? value.get<std::string>() : dump(value);
    }
    return result;
}

} // namespace credvault::json_codec
