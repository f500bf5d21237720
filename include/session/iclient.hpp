#pragma once

#include "core/types.hpp"
#include "session/itransaction.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace graphroute {

/**
 * @brief Alias-addressed client over a set of named connections
 *
 * Built by an IClientFactory. The routing layer never talks to a node
 * except through the alias it was registered under.
 */
class IClient {
public:
    virtual ~IClient() = default;

    /**
     * @brief Send statements over the named connection
     * @return One result per statement, in order
     */
    [[nodiscard]] virtual ResultSet run_statements(
        const std::vector<Statement>& statements, const std::string& alias) = 0;

    [[nodiscard]] virtual std::shared_ptr<ITransaction> open_transaction(
        const std::optional<std::vector<Statement>>& statements, const std::string& alias) = 0;
};

} // namespace graphroute
