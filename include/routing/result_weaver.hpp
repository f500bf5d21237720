#pragma once

#include "classifier/statement_classifier.hpp"
#include "core/types.hpp"

namespace graphroute {

/**
 * @brief Restores the caller's statement order after a read/write split
 *
 * Pure merge: read_results[k] belongs to batch.reads[k], write_results[k]
 * to batch.writes[k]; each lands at its statement's original index.
 */
class ResultWeaver {
public:
    /**
     * @throws RoutingError (RESULT_MISMATCH) if a side's result count does
     *         not match the number of statements dispatched for it
     */
    [[nodiscard]] static ResultSet weave(
        const ClassifiedBatch& batch,
        ResultSet read_results,
        ResultSet write_results);
};

} // namespace graphroute
