#include "vault/connection_registry.hpp"
#include "core/utils.hpp"
#include "vault/connection_state_tracker.hpp"
#include "vault/credential_store.hpp"

#include <format>
#include <stdexcept>

namespace credvault {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<CredentialStore> store,
                                       std::shared_ptr<ConnectionStateTracker> tracker,
                                       Config config)
    : store_(std::move(store)),
      tracker_(std::move(tracker)),
      config_(config) {
    if (!store_ || !tracker_) {
        throw std::invalid_argument("ConnectionRegistry requires a store and a tracker");
    }
}

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<CredentialStore> store,
                                       std::shared_ptr<ConnectionStateTracker> tracker)
    : ConnectionRegistry(std::move(store), std::move(tracker), Config{}) {}

Result<std::optional<Credential>> ConnectionRegistry::on_connected(
    const ConnectionIdentityFields& identity) {
    auto found = store_->check_duplicate(identity);
    if (found.is_error()) {
        return found;
    }
    if (!found.value()) {
        utils::log::debug(std::format("Connected to {}:{}/{} without a stored credential",
            identity.host, identity.port, identity.database));
        return found;
    }

    Credential& credential = *found.value();
    if (config_.single_active_connection) {
        tracker_->replace_all(credential.connection_hash);
    } else {
        tracker_->mark_connected(credential.connection_hash);
    }

    const auto touched = store_->touch(credential.id);
    if (touched.is_error()) {
        // Connected state is already recorded; a stale last_used is not fatal
        utils::log::warn(std::format("Credential {}: {}", credential.id, touched.error_message()));
    }

    utils::log::info(std::format("Connection active: credential id={} hash={}",
        credential.id, utils::short_hash(credential.connection_hash)));
    return found;
}

void ConnectionRegistry::on_disconnected() {
    tracker_->clear_all();
}

void ConnectionRegistry::on_disconnected(const std::string& connection_hash) {
    tracker_->clear(connection_hash);
}

Result<std::vector<ConnectionView>> ConnectionRegistry::connections(
    const std::optional<std::string>& owner_session) {
    auto listed = store_->list(owner_session);
    if (listed.is_error()) {
        return Result<std::vector<ConnectionView>>::error(listed.error_category(),
                                                          listed.error_message());
    }

    std::vector<ConnectionView> views;
    views.reserve(listed.value().size());
    for (auto& credential : listed.value()) {
        const bool connected = tracker_->is_connected(credential.connection_hash);
        views.push_back(ConnectionView{std::move(credential), connected, std::nullopt});
    }
    return Result<std::vector<ConnectionView>>::ok(std::move(views));
}

Result<ConnectionView> ConnectionRegistry::connection_with_secret(int64_t id,
                                                                  const RequestContext& ctx) {
    auto credential = store_->get(id, ctx);
    if (credential.is_error()) {
        return Result<ConnectionView>::error(credential.error_category(),
                                             credential.error_message());
    }

    auto secret = store_->get_secret(id, ctx);
    if (secret.is_error()) {
        return Result<ConnectionView>::error(secret.error_category(), secret.error_message());
    }

    ConnectionView view;
    view.connected = tracker_->is_connected(credential.value().connection_hash);
    view.credential = std::move(credential.value());
    view.secret = std::move(secret.value());
    return Result<ConnectionView>::ok(std::move(view));
}

} // namespace credvault
