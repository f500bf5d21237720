#pragma once

#include "core/types.hpp"
#include "session/iclient.hpp"

#include <memory>
#include <vector>

namespace graphroute {

/**
 * @brief Abstract factory turning named connection specs into a client
 *
 * Each driver backend provides its own. Connections of a replaced client
 * are released by the client itself when its last owner lets go.
 */
class IClientFactory {
public:
    virtual ~IClientFactory() = default;

    /**
     * @brief Build a client holding one connection per spec
     * @param connections Alias, URL and config of every connection
     * @throws on failure; the routing layer reports it as a discovery error
     */
    [[nodiscard]] virtual std::shared_ptr<IClient> build(
        const std::vector<ConnectionSpec>& connections) = 0;
};

} // namespace graphroute
