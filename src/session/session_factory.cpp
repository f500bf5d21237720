#include "session/session_factory.hpp"
#include "core/utils.hpp"
#include "session/auto_routed_session.hpp"

#include <format>

namespace graphroute {

std::shared_ptr<ISession> make_session(
    std::shared_ptr<ISession> reference_session,
    std::shared_ptr<IClientFactory> client_factory,
    const ConnectionConfig& config,
    const std::string& url,
    TopologyManager::Clock clock) {

    if (!config.auto_routing) {
        return reference_session;
    }

    utils::log::debug(std::format("Auto-routing enabled for database '{}'", config.database));
    return std::make_shared<AutoRoutedSession>(
        std::move(reference_session), std::move(client_factory), config, url, std::move(clock));
}

} // namespace graphroute
