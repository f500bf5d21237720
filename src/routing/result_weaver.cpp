#include "routing/result_weaver.hpp"
#include "core/error.hpp"

#include <format>
#include <optional>

namespace graphroute {

namespace {

void place(const std::vector<IndexedStatement>& statements,
           ResultSet& results,
           std::vector<std::optional<StatementResult>>& slots,
           const char* side) {
    if (results.size() != statements.size()) {
        throw RoutingError(ErrorCategory::RESULT_MISMATCH,
            std::format("{} dispatch returned {} results for {} statements",
                side, results.size(), statements.size()));
    }
    for (size_t k = 0; k < statements.size(); ++k) {
        slots[statements[k].index] = std::move(results[k]);
    }
}

} // anonymous namespace

ResultSet ResultWeaver::weave(
    const ClassifiedBatch& batch,
    ResultSet read_results,
    ResultSet write_results) {

    std::vector<std::optional<StatementResult>> slots(batch.size());

    place(batch.reads, read_results, slots, "read");
    place(batch.writes, write_results, slots, "write");

    ResultSet woven;
    woven.reserve(slots.size());
    for (size_t p = 0; p < slots.size(); ++p) {
        if (!slots[p]) {
            throw RoutingError(ErrorCategory::RESULT_MISMATCH,
                std::format("no result for statement {}", p));
        }
        woven.push_back(std::move(*slots[p]));
    }
    return woven;
}

} // namespace graphroute
