#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "probability_matrix.hpp"
#include "errors.hpp"
#include <limits>
#include <sstream>

using namespace poolrisk;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Row normalization
// ============================================================================

TEST_CASE("normalize_row rescales to a unit sum", "[probabilities]") {
    MatchProbabilities row("derby", 2.0, 1.0, 1.0);
    REQUIRE(normalize_row(row));
    REQUIRE_THAT(row.p_home, WithinRel(0.5, 1e-12));
    REQUIRE_THAT(row.p_draw, WithinRel(0.25, 1e-12));
    REQUIRE_THAT(row.p_away, WithinRel(0.25, 1e-12));
}

TEST_CASE("normalize_row reports rows already summing to one", "[probabilities]") {
    MatchProbabilities row("m", 0.5, 0.3, 0.2);
    REQUIRE_FALSE(normalize_row(row));
    REQUIRE_THAT(row.total(), WithinAbs(1.0, 1e-12));
}

TEST_CASE("normalize_row rejects invalid rows", "[probabilities]") {
    SECTION("Negative probability names the match") {
        MatchProbabilities row("cup-final", 0.7, -0.1, 0.4);
        try {
            normalize_row(row);
            FAIL("expected InvalidProbabilityRow");
        } catch (const InvalidProbabilityRow& e) {
            REQUIRE(e.match_id() == "cup-final");
        }
    }

    SECTION("Zero sum") {
        MatchProbabilities row("m", 0.0, 0.0, 0.0);
        REQUIRE_THROWS_AS(normalize_row(row), InvalidProbabilityRow);
    }

    SECTION("Non-finite value") {
        MatchProbabilities row("m", 0.5, std::numeric_limits<double>::infinity(), 0.2);
        REQUIRE_THROWS_AS(normalize_row(row), InvalidProbabilityRow);
    }
}

// ============================================================================
// Matrix construction
// ============================================================================

TEST_CASE("ProbabilityMatrix normalizes rows and names anonymous matches", "[probabilities]") {
    ProbabilityMatrix matrix({
        MatchProbabilities("", 0.5, 0.3, 0.2),
        MatchProbabilities("", 4.0, 3.0, 3.0),
    });

    REQUIRE(matrix.num_matches() == 2);
    REQUIRE(matrix.row(0).match_id == "M1");
    REQUIRE(matrix.row(1).match_id == "M2");
    REQUIRE(matrix.rows_renormalized() == 1);
    REQUIRE_THAT(matrix.probability(1, Outcome::Home), WithinRel(0.4, 1e-12));
    REQUIRE_THROWS_AS(matrix.row(2), std::out_of_range);
}

// ============================================================================
// CSV loading
// ============================================================================

TEST_CASE("Load probability matrix from CSV", "[probabilities][csv]") {
    SECTION("Raw probability columns") {
        std::istringstream csv(
            "match_id,p_home,p_draw,p_away\n"
            "1,0.5,0.3,0.2\n"
            "2,0.4,0.3,0.3\n");
        auto matrix = ProbabilityMatrix::load_from_csv(csv);
        REQUIRE(matrix.num_matches() == 2);
        REQUIRE(matrix.row(0).match_id == "1");
        REQUIRE_THAT(matrix.probability(0, Outcome::Home), WithinRel(0.5, 1e-12));
        REQUIRE_THAT(matrix.probability(1, Outcome::Away), WithinRel(0.3, 1e-12));
    }

    SECTION("Final columns win over raw columns") {
        std::istringstream csv(
            "p_home,p_draw,p_away,p_home_final,p_draw_final,p_away_final\n"
            "0.2,0.2,0.6,0.6,0.2,0.2\n");
        auto matrix = ProbabilityMatrix::load_from_csv(csv);
        REQUIRE_THAT(matrix.probability(0, Outcome::Home), WithinRel(0.6, 1e-12));
    }

    SECTION("Header matching is case-insensitive and match_id is optional") {
        std::istringstream csv(
            "P_Home,P_DRAW,p_away\n"
            "0.5,0.3,0.2\n");
        auto matrix = ProbabilityMatrix::load_from_csv(csv);
        REQUIRE(matrix.row(0).match_id == "M1");
    }

    SECTION("Configured column names") {
        std::istringstream csv(
            "game,h,d,a\n"
            "derby,0.5,0.25,0.25\n");
        ProbabilityColumns columns("game", "h", "d", "a");
        auto matrix = ProbabilityMatrix::load_from_csv(csv, columns);
        REQUIRE(matrix.row(0).match_id == "derby");
        REQUIRE_THAT(matrix.probability(0, Outcome::Draw), WithinRel(0.25, 1e-12));
    }

    SECTION("Blank lines are skipped") {
        std::istringstream csv(
            "p_home,p_draw,p_away\n"
            "0.5,0.3,0.2\n"
            "\n"
            "0.4,0.3,0.3\n");
        REQUIRE(ProbabilityMatrix::load_from_csv(csv).num_matches() == 2);
    }

    SECTION("Blank lines before the header are skipped") {
        std::istringstream csv(
            "\n"
            "\r\n"
            "match_id,p_home,p_draw,p_away\n"
            "A,0.5,0.3,0.2\n");
        auto matrix = ProbabilityMatrix::load_from_csv(csv);
        REQUIRE(matrix.num_matches() == 1);
        REQUIRE(matrix.row(0).match_id == "A");
    }
}

TEST_CASE("Probability CSV schema violations", "[probabilities][csv]") {
    SECTION("No recognized columns") {
        std::istringstream csv("match_id,home,draw,away\n1,0.5,0.3,0.2\n");
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv(csv), SchemaError);
    }

    SECTION("Configured columns missing") {
        std::istringstream csv("p_home,p_draw,p_away\n0.5,0.3,0.2\n");
        ProbabilityColumns columns("id", "h", "d", "a");
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv(csv, columns), SchemaError);
    }

    SECTION("Header only") {
        std::istringstream csv("p_home,p_draw,p_away\n");
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv(csv), SchemaError);
    }

    SECTION("Empty input") {
        std::istringstream csv("");
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv(csv), SchemaError);
    }

    SECTION("Only blank lines") {
        std::istringstream csv("\n\n");
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv(csv), SchemaError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv("/nonexistent/probs.csv"), SchemaError);
    }

    SECTION("Non-numeric cell") {
        std::istringstream csv("match_id,p_home,p_draw,p_away\nM7,0.5,abc,0.2\n");
        try {
            ProbabilityMatrix::load_from_csv(csv);
            FAIL("expected InvalidProbabilityRow");
        } catch (const InvalidProbabilityRow& e) {
            REQUIRE(e.match_id() == "M7");
        }
    }

    SECTION("Negative probability") {
        std::istringstream csv("p_home,p_draw,p_away\n0.5,0.3,0.2\n-0.1,0.6,0.5\n");
        REQUIRE_THROWS_AS(ProbabilityMatrix::load_from_csv(csv), InvalidProbabilityRow);
    }
}
