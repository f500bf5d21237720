#pragma once

#include "core/types.hpp"
#include "session/itransaction.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace graphroute {

/**
 * @brief Session contract shared by plain and auto-routed sessions
 *
 * Implementations report transport and server failures by throwing.
 */
class ISession {
public:
    virtual ~ISession() = default;

    /**
     * @brief Run a batch of statements
     * @return One StatementResult per input statement, in input order
     */
    [[nodiscard]] virtual ResultSet run(const std::vector<Statement>& statements) = 0;

    /**
     * @brief Begin a transaction
     * @param statements Optional statements to run right after BEGIN
     * @param alias Connection to open on; the session picks one if empty
     */
    [[nodiscard]] virtual std::shared_ptr<ITransaction> open_transaction(
        const std::optional<std::vector<Statement>>& statements = std::nullopt,
        const std::optional<std::string>& alias = std::nullopt) = 0;

    [[nodiscard]] virtual ResultSet run_over_transaction(
        ITransaction& transaction, const std::vector<Statement>& statements) = 0;

    [[nodiscard]] virtual ResultSet commit_transaction(
        ITransaction& transaction, const std::vector<Statement>& statements) = 0;

    virtual void rollback_transaction(ITransaction& transaction) = 0;
};

} // namespace graphroute
