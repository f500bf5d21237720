#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "routing/result_weaver.hpp"

using namespace graphroute;

namespace {

StatementResult labelled(const std::string& label) {
    return {Record{{"label", label}}};
}

} // anonymous namespace

TEST_CASE("ResultWeaver: interleaved reads and writes return in input order", "[weaver]") {
    const std::vector<Statement> statements = {
        Statement("MATCH (a) RETURN a"),
        Statement("CREATE (b)"),
        Statement("MATCH (c) RETURN c"),
    };
    const auto batch = StatementClassifier::classify(statements);

    const auto woven = ResultWeaver::weave(batch,
        {labelled("A"), labelled("C")},
        {labelled("B")});

    REQUIRE(woven.size() == 3);
    CHECK(woven[0][0]["label"] == "A");
    CHECK(woven[1][0]["label"] == "B");
    CHECK(woven[2][0]["label"] == "C");
}

TEST_CASE("ResultWeaver: only reads or only writes", "[weaver]") {
    const auto reads_only = StatementClassifier::classify({
        Statement("RETURN 1"), Statement("RETURN 2"),
    });
    auto woven = ResultWeaver::weave(reads_only, {labelled("1"), labelled("2")}, {});
    REQUIRE(woven.size() == 2);
    CHECK(woven[1][0]["label"] == "2");

    const auto writes_only = StatementClassifier::classify({Statement("CREATE (n)")});
    woven = ResultWeaver::weave(writes_only, {}, {labelled("w")});
    REQUIRE(woven.size() == 1);
    CHECK(woven[0][0]["label"] == "w");
}

TEST_CASE("ResultWeaver: empty batch weaves to empty result", "[weaver]") {
    const auto woven = ResultWeaver::weave(StatementClassifier::classify({}), {}, {});
    CHECK(woven.empty());
}

TEST_CASE("ResultWeaver: empty statement results are kept in place", "[weaver]") {
    const auto batch = StatementClassifier::classify({
        Statement("CREATE (n)"), Statement("MATCH (n) RETURN n"),
    });
    const auto woven = ResultWeaver::weave(batch, {labelled("r")}, {StatementResult{}});

    REQUIRE(woven.size() == 2);
    CHECK(woven[0].empty());
    CHECK(woven[1][0]["label"] == "r");
}

TEST_CASE("ResultWeaver: result count mismatch throws", "[weaver]") {
    const auto batch = StatementClassifier::classify({
        Statement("MATCH (a) RETURN a"), Statement("CREATE (b)"),
    });

    CHECK_THROWS_AS(ResultWeaver::weave(batch, {}, {labelled("B")}), RoutingError);
    CHECK_THROWS_AS(ResultWeaver::weave(batch, {labelled("A")}, {labelled("B"), labelled("X")}),
                    RoutingError);

    try {
        (void)ResultWeaver::weave(batch, {labelled("A")}, {});
        FAIL("expected RoutingError");
    } catch (const RoutingError& e) {
        CHECK(e.category() == ErrorCategory::RESULT_MISMATCH);
    }
}
