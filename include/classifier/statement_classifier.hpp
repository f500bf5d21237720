#pragma once

#include "core/types.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace graphroute {

enum class StatementRole {
    READ,
    WRITE
};

/**
 * @brief A batch split by role
 *
 * Each side keeps input order and remembers every statement's original
 * position so results can be put back where they came from.
 */
struct ClassifiedBatch {
    std::vector<IndexedStatement> reads;
    std::vector<IndexedStatement> writes;

    [[nodiscard]] size_t size() const { return reads.size() + writes.size(); }
};

/**
 * @brief Static read/write classification of graph query statements
 *
 * A statement is a write if its text contains any write keyword as a plain
 * substring. No parsing: "PRESET" matches SET, and matching is
 * case-sensitive. Cheap and conservative.
 */
class StatementClassifier {
public:
    static constexpr std::array<std::string_view, 5> kWriteKeywords = {
        "CREATE", "SET", "MERGE", "DELETE", "CALL",
    };

    [[nodiscard]] static StatementRole role_of(std::string_view text);

    [[nodiscard]] static bool is_write(std::string_view text) {
        return role_of(text) == StatementRole::WRITE;
    }

    /**
     * @brief Partition statements into reads and writes
     * @param statements Caller's batch, in order
     * @return Both sides, every statement in exactly one of them
     */
    [[nodiscard]] static ClassifiedBatch classify(const std::vector<Statement>& statements);
};

} // namespace graphroute
