#pragma once

#include "core/types.hpp"
#include <vector>

namespace graphroute {

/**
 * @brief Open transaction on a single connection
 *
 * Provided by the session/client layer; bound to one alias for its lifetime.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    /**
     * @brief Run statements inside the transaction
     * @return One result per statement, in order
     */
    [[nodiscard]] virtual ResultSet run_statements(const std::vector<Statement>& statements) = 0;

    /**
     * @brief Run the final statements and commit
     */
    [[nodiscard]] virtual ResultSet commit(const std::vector<Statement>& statements) = 0;

    virtual void rollback() = 0;
};

} // namespace graphroute
