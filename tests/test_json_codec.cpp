#include <catch2/catch_test_macros.hpp>
#include "core/json_codec.hpp"
#include "core/utils.hpp"

using namespace credvault;

namespace {

Credential sample_credential() {
    Credential c;
    c.id = 42;
    c.connection_hash = std::string(64, 'a');
    c.name = "analytics";
    c.host = "db.internal";
    c.port = 5432;
    c.database = "warehouse";
    c.username = "reporter";
    c.engine_type = "postgresql";
    c.encrypted_secret = "Q0lQSEVSVEVYVA==";
    c.encryption_salt = std::string(32, '0');
    c.created_at = utils::from_epoch_micros(1700000000000000);
    c.updated_at = c.created_at;
    c.last_used = utils::from_epoch_micros(1700000000123456);
    c.owner_session = "session-1";
    return c;
}

} // anonymous namespace

TEST_CASE("JsonCodec: credential view omits ciphertext and salt", "[json]") {
    const auto j = json_codec::credential_to_json(sample_credential());

    CHECK(j["id"] == 42);
    CHECK(j["name"] == "analytics");
    CHECK(j["port"] == 5432);
    CHECK(j["engine_type"] == "postgresql");
    CHECK(j["owner_session"] == "session-1");
    CHECK(j["has_credentials"] == true);
    CHECK(j["last_used"] == "2023-11-14T22:13:20.123456Z");
    CHECK_FALSE(j.contains("encrypted_secret"));
    CHECK_FALSE(j.contains("encryption_salt"));
    CHECK(j.dump().find("Q0lQSEVSVEVYVA==") == std::string::npos);
}

TEST_CASE("JsonCodec: global credential has null owner", "[json]") {
    auto c = sample_credential();
    c.owner_session.reset();
    CHECK(json_codec::credential_to_json(c)["owner_session"].is_null());
}

TEST_CASE("JsonCodec: connection view stringifies id and port", "[json]") {
    ConnectionView view{sample_credential(), true, std::nullopt};
    const auto j = json_codec::connection_view_to_json(view);

    CHECK(j["id"] == "42");
    CHECK(j["config"]["port"] == "5432");
    CHECK(j["config"]["password"] == "");
    CHECK(j["type"] == "postgresql");
    CHECK(j["status"] == "connected");
    CHECK(j["hasSecureCredentials"] == true);

    view.connected = false;
    view.secret = "plain";
    const auto with_secret = json_codec::connection_view_to_json(view);
    CHECK(with_secret["status"] == "disconnected");
    CHECK(with_secret["config"]["password"] == "plain");
}

TEST_CASE("JsonCodec: save result carries status and duplicate flag", "[json]") {
    SaveResult result{SaveStatus::EXISTS, sample_credential(), true,
                      "Credentials already exist for this connection"};
    const auto j = json_codec::save_result_to_json(result);
    CHECK(j["status"] == "exists");
    CHECK(j["duplicate"] == true);
    CHECK(j["credential"]["id"] == 42);

    SaveResult failed;
    failed.message = "boom";
    const auto f = json_codec::save_result_to_json(failed);
    CHECK(f["status"] == "error");
    CHECK(f["credential"].is_null());
}

TEST_CASE("JsonCodec: audit entry with and without metadata", "[json][audit]") {
    AuditEntry entry;
    entry.id = 7;
    entry.connection_hash = "abc";
    entry.operation = AuditOperation::DUPLICATE_CHECK;
    entry.success = true;

    auto j = json_codec::audit_entry_to_json(entry);
    CHECK(j["operation"] == "duplicate_check");
    CHECK(j["credential_id"].is_null());
    CHECK(j["metadata"].is_null());

    entry.credential_id = 3;
    entry.metadata = {{"action", "found_existing"}};
    j = json_codec::audit_entry_to_json(entry);
    CHECK(j["credential_id"] == 3);
    CHECK(j["metadata"]["action"] == "found_existing");
}

TEST_CASE("JsonCodec: metadata string form", "[json][audit]") {
    CHECK(json_codec::metadata_to_string({}).empty());
    CHECK(json_codec::metadata_from_string("").empty());

    const std::map<std::string, std::string> bag{{"name", "prod"}, {"engine_type", "mysql"}};
    CHECK(json_codec::metadata_from_string(json_codec::metadata_to_string(bag)) == bag);

    const auto mixed = json_codec::metadata_from_string(R"({"count": 3, "flag": true, "s": "x"})");
    CHECK(mixed.at("count") == "3");
    CHECK(mixed.at("flag") == "true");
    CHECK(mixed.at("s") == "x");

    CHECK(json_codec::metadata_from_string("[1,2]").empty());
    CHECK_THROWS(json_codec::metadata_from_string("{not json"));
}

TEST_CASE("JsonCodec: invalid UTF-8 is replaced instead of throwing", "[json][audit]") {
    const std::map<std::string, std::string> bag{{"name", "caf\xe9"}, {"engine_type", "postgresql"}};

    std::string text;
    REQUIRE_NOTHROW(text = json_codec::metadata_to_string(bag));
    const auto parsed = json_codec::metadata_from_string(text);
    CHECK(parsed.at("name") == "caf\xEF\xBF\xBD");
    CHECK(parsed.at("engine_type") == "postgresql");

    auto view = sample_credential();
    view.name = "\xff\xfe";
    CHECK_NOTHROW(json_codec::dump(json_codec::credential_to_json(view), 2));
}
