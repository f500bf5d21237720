#pragma once

#include "routing/topology_manager.hpp"
#include "session/isession.hpp"

#include <memory>
#include <string>

namespace graphroute {

class IClientFactory;

/**
 * @brief Wrap a session in auto-routing when its connection asks for it
 *
 * @return AutoRoutedSession over reference_session if config.auto_routing,
 *         otherwise reference_session itself
 */
[[nodiscard]] std::shared_ptr<ISession> make_session(
    std::shared_ptr<ISession> reference_session,
    std::shared_ptr<IClientFactory> client_factory,
    const ConnectionConfig& config,
    const std::string& url,
    TopologyManager::Clock clock = nullptr);

} // namespace graphroute
