#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "portfolio.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>
#include <sstream>

using namespace poolrisk;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

namespace {

Ticket ticket_with_weight(double weight) {
    return Ticket({CoverageSet::single(Outcome::Home), CoverageSet::full()}, weight);
}

} // anonymous namespace

// ============================================================================
// Weight normalization
// ============================================================================

TEST_CASE("Normalize weights", "[portfolio][weights]") {
    SECTION("Proportional weights") {
        auto w = normalize_weights({2.0, 2.0, 0.0});
        REQUIRE(w.size() == 3);
        REQUIRE_THAT(w[0], WithinRel(0.5, 1e-12));
        REQUIRE_THAT(w[1], WithinRel(0.5, 1e-12));
        REQUIRE(w[2] == 0.0);
    }

    SECTION("All zero falls back to uniform") {
        auto w = normalize_weights({0.0, 0.0, 0.0});
        for (double x : w) {
            REQUIRE_THAT(x, WithinRel(1.0 / 3.0, 1e-12));
        }
        REQUIRE(weights_fall_back_to_uniform({0.0, 0.0, 0.0}));
    }

    SECTION("A negative weight falls back to uniform") {
        auto w = normalize_weights({3.0, -1.0});
        REQUIRE_THAT(w[0], WithinRel(0.5, 1e-12));
        REQUIRE_THAT(w[1], WithinRel(0.5, 1e-12));
    }

    SECTION("A non-finite weight falls back to uniform") {
        REQUIRE(weights_fall_back_to_uniform({1.0, std::numeric_limits<double>::quiet_NaN()}));
        REQUIRE(weights_fall_back_to_uniform({1.0, std::numeric_limits<double>::infinity()}));
    }

    SECTION("Valid weights sum to one") {
        auto w = normalize_weights({1.0, 3.0});
        REQUIRE_THAT(w[0] + w[1], WithinRel(1.0, 1e-12));
        REQUIRE_FALSE(weights_fall_back_to_uniform({1.0, 3.0}));
    }
}

// ============================================================================
// Portfolio
// ============================================================================

TEST_CASE("Portfolio construction", "[portfolio]") {
    SECTION("Weights come from the tickets") {
        Portfolio p({ticket_with_weight(1.0), ticket_with_weight(3.0)});
        REQUIRE(p.num_tickets() == 2);
        REQUIRE(p.num_matches() == 2);
        REQUIRE_THAT(p.weights()[1], WithinRel(0.75, 1e-12));
        REQUIRE_FALSE(p.uniform_weight_fallback());
        REQUIRE(p.pay_table().is_default());
    }

    SECTION("Invalid weights are flagged") {
        Portfolio p({ticket_with_weight(0.0), ticket_with_weight(0.0)});
        REQUIRE(p.uniform_weight_fallback());
        REQUIRE_THAT(p.weights()[0], WithinRel(0.5, 1e-12));
    }

    SECTION("Empty portfolio") {
        REQUIRE_THROWS_AS(Portfolio(std::vector<Ticket>{}), SchemaError);
    }

    SECTION("Tickets of different lengths") {
        Ticket short_ticket({CoverageSet::full()});
        REQUIRE_THROWS_AS(Portfolio({ticket_with_weight(1.0), short_ticket}), ShapeMismatch);
    }

    SECTION("Ticket index out of range") {
        Portfolio p({ticket_with_weight(1.0)});
        REQUIRE_THROWS_AS(p.ticket(1), std::out_of_range);
    }
}

// ============================================================================
// Portfolio plan CSV
// ============================================================================

TEST_CASE("Load portfolio plan", "[portfolio][csv]") {
    SECTION("Picks and stake weights") {
        std::istringstream csv(
            "J1,J2,J3,stake_weight\n"
            "1,1X,1X2,2\n"
            "2,X,1,1\n");
        auto plan = PortfolioPlan::load_from_csv(csv, 3);
        REQUIRE(plan.tickets.size() == 2);
        REQUIRE(plan.has_stake_weight_column);
        REQUIRE(plan.warnings.empty());
        REQUIRE(plan.tickets[0].to_string() == "1|1X|1X2");
        REQUIRE(plan.tickets[0].stake_weight == 2.0);
        REQUIRE(plan.tickets[1].to_string() == "2|X|1");
    }

    SECTION("Column order and case do not matter") {
        std::istringstream csv(
            "name,j2,J1\n"
            "a,X,1\n");
        auto plan = PortfolioPlan::load_from_csv(csv, 2);
        REQUIRE(plan.tickets[0].to_string() == "1|X");
        REQUIRE_FALSE(plan.has_stake_weight_column);
        REQUIRE(plan.tickets[0].stake_weight == 1.0);
    }

    SECTION("Blank lines before the header are skipped") {
        std::istringstream csv(
            "\n"
            "J1,J2\n"
            "1,X2\n");
        auto plan = PortfolioPlan::load_from_csv(csv, 2);
        REQUIRE(plan.tickets.size() == 1);
        REQUIRE(plan.tickets[0].to_string() == "1|X2");
    }

    SECTION("Unrecognized and missing cells fall back to full cover with a warning") {
        std::istringstream csv(
            "J1,J2,J3\n"
            "1,?\n");
        auto plan = PortfolioPlan::load_from_csv(csv, 3);
        REQUIRE(plan.tickets[0].to_string() == "1|1X2|1X2");
        REQUIRE(plan.warnings.size() == 1);
        REQUIRE_THAT(plan.warnings[0], ContainsSubstring("Ticket 1"));
        REQUIRE_THAT(plan.warnings[0], ContainsSubstring("J2,J3"));
    }

    SECTION("Invalid stake weight is recorded as NaN with a warning") {
        std::istringstream csv(
            "J1,stake_weight\n"
            "1,heavy\n"
            "2,1\n");
        auto plan = PortfolioPlan::load_from_csv(csv, 1);
        REQUIRE(std::isnan(plan.tickets[0].stake_weight));
        REQUIRE(plan.warnings.size() == 1);
        REQUIRE_THAT(plan.warnings[0], ContainsSubstring("invalid stake_weight 'heavy'"));

        Portfolio portfolio(plan.tickets);
        REQUIRE(portfolio.uniform_weight_fallback());
    }
}

TEST_CASE("Portfolio plan schema violations", "[portfolio][csv]") {
    SECTION("No pick columns") {
        std::istringstream csv("a,b\n1,2\n");
        REQUIRE_THROWS_AS(PortfolioPlan::load_from_csv(csv, 2), SchemaError);
    }

    SECTION("Gap in pick columns") {
        std::istringstream csv("J1,J3\n1,2\n");
        REQUIRE_THROWS_AS(PortfolioPlan::load_from_csv(csv, 2), SchemaError);
    }

    SECTION("Missing J1") {
        std::istringstream csv("J2,J3\n1,2\n");
        REQUIRE_THROWS_AS(PortfolioPlan::load_from_csv(csv, 2), SchemaError);
    }

    SECTION("Duplicate pick column") {
        std::istringstream csv("J1,j1\n1,2\n");
        REQUIRE_THROWS_AS(PortfolioPlan::load_from_csv(csv, 1), SchemaError);
    }

    SECTION("Pick column count differs from the match count") {
        std::istringstream csv("J1,J2\n1,2\n");
        try {
            PortfolioPlan::load_from_csv(csv, 3);
            FAIL("expected TicketShapeMismatch");
        } catch (const TicketShapeMismatch& e) {
            REQUIRE(e.ticket_length() == 2);
            REQUIRE(e.num_matches() == 3);
        }
    }

    SECTION("No ticket rows") {
        std::istringstream csv("J1,J2\n");
        REQUIRE_THROWS_AS(PortfolioPlan::load_from_csv(csv, 2), SchemaError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(PortfolioPlan::load_from_csv("/nonexistent/plan.csv", 2), SchemaError);
    }
}
