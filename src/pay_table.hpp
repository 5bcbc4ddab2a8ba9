#ifndef POOLRISK_PAY_TABLE_HPP
#define POOLRISK_PAY_TABLE_HPP

#include <map>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace poolrisk {

// Winner-take-all: 1.0 when every match is hit, 0.0 otherwise
struct DefaultBinaryScheme {};

// Hit count -> payout; hit counts absent from the map pay 0
struct ExplicitTable {
    std::map<int, double> payouts;
};

// PayTable: resolved once, then only queried. Immutable.
class PayTable {
public:
    PayTable();  // DefaultBinaryScheme
    explicit PayTable(std::map<int, double> payouts);

    bool is_default() const { return std::holds_alternative<DefaultBinaryScheme>(scheme_); }

    // Payout for `hits` correct matches out of `num_matches`
    double payout(size_t hits, size_t num_matches) const;

    // Empty for the default scheme
    const std::map<int, double>& entries() const;

    std::string describe() const;

    // Parse {"14": 1000, "13": 25}. Keys must be integer strings, values
    // numbers (numeric strings are accepted). Throws std::invalid_argument
    // on anything else.
    static PayTable from_json(const nlohmann::json& j);
    static PayTable from_json_string(const std::string& text);

private:
    std::variant<DefaultBinaryScheme, ExplicitTable> scheme_;
};

} // namespace poolrisk

#endif // POOLRISK_PAY_TABLE_HPP
