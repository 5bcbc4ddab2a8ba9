#include "pay_table.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace poolrisk {

PayTable::PayTable() : scheme_(DefaultBinaryScheme{}) {}

PayTable::PayTable(std::map<int, double> payouts)
    : scheme_(ExplicitTable{std::move(payouts)}) {}

double PayTable::payout(size_t hits, size_t num_matches) const {
    if (const auto* table = std::get_if<ExplicitTable>(&scheme_)) {
        auto it = table->payouts.find(static_cast<int>(hits));
        return it != table->payouts.end() ? it->second : 0.0;
    }
    return hits == num_matches ? 1.0 : 0.0;
}

const std::map<int, double>& PayTable::entries() const {
    static const std::map<int, double> empty;
    if (const auto* table = std::get_if<ExplicitTable>(&scheme_)) {
        return table->payouts;
    }
    return empty;
}

std::string PayTable::describe() const {
    if (is_default()) {
        return "default binary scheme";
    }
    std::ostringstream oss;
    oss << "explicit table {";
    bool first = true;
    for (const auto& [hits, value] : entries()) {
        if (!first) oss << ", ";
        oss << hits << ": " << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

namespace {

int parse_hit_key(const std::string& key) {
    size_t consumed = 0;
    int hits = 0;
    try {
        hits = std::stoi(key, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("pay table key '" + key + "' is not an integer");
    }
    if (consumed != key.size()) {
        throw std::invalid_argument("pay table key '" + key + "' is not an integer");
    }
    return hits;
}

double parse_payout_value(const std::string& key, const json& value) {
    double payout = 0.0;
    if (value.is_number()) {
        payout = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        size_t consumed = 0;
        try {
            payout = std::stod(text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != text.size()) {
            throw std::invalid_argument("pay table value for '" + key + "' is not a number");
        }
    } else {
        throw std::invalid_argument("pay table value for '" + key + "' is not a number");
    }
    if (!std::isfinite(payout)) {
        throw std::invalid_argument("pay table value for '" + key + "' is not finite");
    }
    return payout;
}

} // anonymous namespace

PayTable PayTable::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("pay table must be a JSON object");
    }
    std::map<int, double> payouts;
    for (auto it = j.begin(); it != j.end(); ++it) {
        payouts[parse_hit_key(it.key())] = parse_payout_value(it.key(), it.value());
    }
    return PayTable(std::move(payouts));
}

PayTable PayTable::from_json_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw std::invalid_argument("pay table is not valid JSON: " + std::string(e.what()));
    }
    return from_json(j);
}

} // namespace poolrisk
