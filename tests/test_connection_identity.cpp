#include <catch2/catch_test_macros.hpp>
#include "security/connection_identity.hpp"

#include <algorithm>
#include <cctype>

using namespace credvault;

TEST_CASE("ConnectionIdentity: canonical form joins the five fields", "[identity]") {
    CHECK(ConnectionIdentity::canonical_form("db.example.com", 5432, "app", "alice", "postgresql")
          == "db.example.com:5432/app@alice:postgresql");
}

TEST_CASE("ConnectionIdentity: fingerprint is SHA-256 of the canonical form", "[identity]") {
    CHECK(ConnectionIdentity::fingerprint("db.example.com", 5432, "app", "alice", "postgresql")
          == "40f027c1df931fa68d5529d3212408004c1c7200832a9036119342d2e3ed2cf7");
    CHECK(ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "user", "postgresql")
          == "b44a39c282e3bda37fc95dc7b9db4356a1d81ab07af41b81fbd1b9972d322970");
}

TEST_CASE("ConnectionIdentity: fingerprint is 64 lowercase hex chars", "[identity]") {
    const auto hash = ConnectionIdentity::fingerprint("h", 1, "d", "u", "mysql");
    REQUIRE(hash.size() == ConnectionIdentity::kHashLength);
    CHECK(std::all_of(hash.begin(), hash.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f');
    }));
}

TEST_CASE("ConnectionIdentity: deterministic for identical fields", "[identity]") {
    const ConnectionIdentityFields fields{"localhost", 5432, "mydb", "user", "postgresql"};
    CHECK(ConnectionIdentity::fingerprint(fields) == ConnectionIdentity::fingerprint(fields));
    CHECK(ConnectionIdentity::fingerprint(fields)
          == ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "user", "postgresql"));
}

TEST_CASE("ConnectionIdentity: every field changes the fingerprint", "[identity]") {
    const auto base = ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "user", "postgresql");

    CHECK(ConnectionIdentity::fingerprint("otherhost", 5432, "mydb", "user", "postgresql") != base);
    CHECK(ConnectionIdentity::fingerprint("localhost", 5433, "mydb", "user", "postgresql") != base);
    CHECK(ConnectionIdentity::fingerprint("localhost", 5432, "otherdb", "user", "postgresql") != base);
    CHECK(ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "admin", "postgresql") != base);
    CHECK(ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "user", "mysql") != base);
}

TEST_CASE("ConnectionIdentity: no case folding or trimming", "[identity]") {
    const auto base = ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "user", "postgresql");
    CHECK(ConnectionIdentity::fingerprint("LOCALHOST", 5432, "mydb", "user", "postgresql") != base);
    CHECK(ConnectionIdentity::fingerprint("localhost ", 5432, "mydb", "user", "postgresql") != base);
    CHECK(ConnectionIdentity::fingerprint("localhost", 5432, "mydb", "user", "PostgreSQL") != base);
}
