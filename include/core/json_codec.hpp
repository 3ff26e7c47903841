#pragma once

#include "audit/audit_entry.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace credvault::json_codec {

/// Compact (or indented) text; invalid UTF-8 is replaced with U+FFFD instead of throwing
[[nodiscard]] std::string dump(const nlohmann::json& j, int indent = -1);

/// Listing view of a credential. Never contains the ciphertext or salt.
[[nodiscard]] nlohmann::json credential_to_json(const Credential& credential);

[[nodiscard]] nlohmann::json save_result_to_json(const SaveResult& result);

[[nodiscard]] nlohmann::json audit_entry_to_json(const AuditEntry& entry);

/// Client-facing connection config; "password" is empty unless a secret is attached
[[nodiscard]] nlohmann::json connection_view_to_json(const ConnectionView& view);

/// Serialize the audit metadata bag; empty bag yields an empty string
[[nodiscard]] std::string metadata_to_string(const std::map<std::string, std::string>& metadata);

/// Parse a stored metadata bag. Non-string values are kept in their JSON text form.
/// @throws nlohmann::json::parse_error on malformed input
[[nodiscard]] std::map<std::string, std::string> metadata_from_string(const std::string& text);

} // namespace credvault::json_codec
