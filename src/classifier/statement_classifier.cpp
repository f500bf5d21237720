#include "classifier/statement_classifier.hpp"

#include <algorithm>

namespace graphroute {

StatementRole StatementClassifier::role_of(std::string_view text) {
    const bool write = std::any_of(kWriteKeywords.begin(), kWriteKeywords.end(),
        [text](std::string_view keyword) {
            return text.find(keyword) != std::string_view::npos;
        });
    return write ? StatementRole::WRITE : StatementRole::READ;
}

ClassifiedBatch StatementClassifier::classify(const std::vector<Statement>& statements) {
    ClassifiedBatch batch;

    for (size_t i = 0; i < statements.size(); ++i) {
        const auto& statement = statements[i];
        if (role_of(statement.text()) == StatementRole::WRITE) {
            batch.writes.push_back({i, statement});
        } else {
            batch.reads.push_back({i, statement});
        }
    }

    return batch;
}

} // namespace graphroute
