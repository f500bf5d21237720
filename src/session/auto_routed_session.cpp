#include "session/auto_routed_session.hpp"
#include "classifier/statement_classifier.hpp"
#include "routing/result_weaver.hpp"
#include "session/iclient.hpp"
#include "session/iclient_factory.hpp"

#include <stdexcept>

namespace graphroute {

namespace {

UrlComponents parse_base_url(const std::string& base_url) {
    auto parts = parse_url(base_url);
    if (!parts) {
        // The URL may carry credentials; keep it out of the message
        throw std::invalid_argument("Invalid connection URL for auto-routed session");
    }
    return std::move(*parts);
}

std::vector<Statement> statements_of(const std::vector<IndexedStatement>& indexed) {
    std::vector<Statement> out;
    out.reserve(indexed.size());
    for (const auto& entry : indexed) {
        out.push_back(entry.statement);
    }
    return out;
}

} // anonymous namespace

AutoRoutedSession::AutoRoutedSession(std::shared_ptr<ISession> reference_session,
                                     std::shared_ptr<IClientFactory> client_factory,
                                     ConnectionConfig config,
                                     const std::string& base_url,
                                     TopologyManager::Clock clock)
    : topology_(std::move(reference_session),
                std::move(client_factory),
                std::move(config),
                parse_base_url(base_url),
                std::move(clock)) {}

ResultSet AutoRoutedSession::run(const std::vector<Statement>& statements) {
    // Hold this snapshot for the whole call; a concurrent refresh can't swap it
    const auto snapshot = topology_.ensure_fresh();
    const auto batch = StatementClassifier::classify(statements);

    // Resolve both targets first: a missing role must fail before anything is sent
    std::string read_alias;
    std::string write_alias;
    if (!batch.reads.empty()) read_alias = snapshot->selector.pick_read_alias();
    if (!batch.writes.empty()) write_alias = snapshot->selector.pick_write_alias();

    ResultSet read_results;
    ResultSet write_results;

    if (!batch.reads.empty()) {
        read_results = snapshot->client->run_statements(statements_of(batch.reads), read_alias);
    }
    if (!batch.writes.empty()) {
        write_results = snapshot->client->run_statements(statements_of(batch.writes), write_alias);
    }

    return ResultWeaver::weave(batch, std::move(read_results), std::move(write_results));
}

std::shared_ptr<ITransaction> AutoRoutedSession::open_transaction(
    const std::optional<std::vector<Statement>>& statements,
    const std::optional<std::string>& alias) {

    const auto snapshot = topology_.ensure_fresh();
    // Statements inside a transaction are not classified: default to a leader
    const std::string target = alias ? *alias : snapshot->selector.pick_write_alias();
    return snapshot->client->open_transaction(statements, target);
}

ResultSet AutoRoutedSession::run_over_transaction(
    ITransaction& transaction, const std::vector<Statement>& statements) {
    return transaction.run_statements(statements);
}

ResultSet AutoRoutedSession::commit_transaction(
    ITransaction& transaction, const std::vector<Statement>& statements) {
    return transaction.commit(statements);
}

void AutoRoutedSession::rollback_transaction(ITransaction& transaction) {
    transaction.rollback();
}

} // namespace graphroute
