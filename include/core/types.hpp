#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace graphroute {

// ============================================================================
// Values
// ============================================================================

using Value = nlohmann::json;

// Named statement parameters (JSON object)
using Parameters = nlohmann::json;

// One result row keyed by column name (JSON object)
using Record = nlohmann::json;

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Statement
// ============================================================================

/**
 * @brief Query text plus its named parameters
 *
 * Immutable once constructed; the routing layer only reads it.
 */
class Statement {
public:
    explicit Statement(std::string text, Parameters parameters = Parameters::object())
        : text_(std::move(text)), parameters_(std::move(parameters)) {}

    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] const Parameters& parameters() const { return parameters_; }

private:
    std::string text_;
    Parameters parameters_;
};

// ============================================================================
// Results
// ============================================================================

// Records returned for a single statement
using StatementResult = std::vector<Record>;

// One StatementResult per dispatched statement, in dispatch order
using ResultSet = std::vector<StatementResult>;

/**
 * @brief Statement tagged with its position in the caller's batch
 */
struct IndexedStatement {
    size_t index;
    Statement statement;
};

// ============================================================================
// Connection Config
// ============================================================================

/**
 * @brief Per-connection settings handed to the client factory
 */
struct ConnectionConfig {
    std::string database = "neo4j";
    bool auto_routing = false;

    [[nodiscard]] ConnectionConfig with_auto_routing(bool enabled) const {
        ConnectionConfig copy = *this;
        copy.auto_routing = enabled;
        return copy;
    }
};

/**
 * @brief One named connection the client factory should build
 */
struct ConnectionSpec {
    std::string alias;
    std::string url;
    ConnectionConfig config;
};

} // namespace graphroute
