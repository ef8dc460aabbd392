// src/core/order_intent.cpp
#include "trade_guard/core/order_intent.hpp"
#include <cmath>

namespace trade_guard {

namespace {

Result<std::optional<double>> optional_number(const nlohmann::json& j, const char* field) {
    if (!j.contains(field) || j.at(field).is_null()) {
        return Result<std::optional<double>>(std::optional<double>());
    }
    const auto& v = j.at(field);
    if (!v.is_number()) {
        return make_error<std::optional<double>>(ErrorCode::INVALID_ARGUMENT,
                                                 std::string(field) + " must be a number",
                                                 "OrderIntent");
    }
    double value = v.get<double>();
    if (!std::isfinite(value)) {
        return make_error<std::optional<double>>(ErrorCode::INVALID_ARGUMENT,
                                                 std::string(field) + " must be finite",
                                                 "OrderIntent");
    }
    return Result<std::optional<double>>(std::optional<double>(value));
}

}  // namespace

Result<OrderIntent> OrderIntent::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT, "Order body must be an object",
                                       "OrderIntent");
    }

    OrderIntent intent;

    if (!j.contains("symbol") || !j.at("symbol").is_string() ||
        j.at("symbol").get<std::string>().empty()) {
        return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT, "symbol is required",
                                       "OrderIntent");
    }
    intent.symbol = j.at("symbol").get<std::string>();

    if (!j.contains("side") || !j.at("side").is_string()) {
        return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT, "side is required",
                                       "OrderIntent");
    }
    intent.side = side_from_string(j.at("side").get<std::string>());
    if (intent.side == Side::NONE) {
        return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT, "side must be BUY or SELL",
                                       "OrderIntent");
    }

    if (j.contains("type")) {
        if (!j.at("type").is_string()) {
            return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT,
                                           "type must be MARKET or LIMIT", "OrderIntent");
        }
        intent.order_type = order_type_from_string(j.at("type").get<std::string>());
        if (intent.order_type == OrderType::NONE) {
            return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT,
                                           "type must be MARKET or LIMIT", "OrderIntent");
        }
    }

    auto notional = optional_number(j, "notional");
    if (notional.is_error())
        return forward_error<OrderIntent>(notional);
    if (!notional.value() || *notional.value() <= 0.0) {
        return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT, "notional must be positive",
                                       "OrderIntent");
    }
    intent.notional = *notional.value();

    struct OptionalField {
        const char* name;
        std::optional<double>* target;
    };
    OptionalField optional_fields[] = {{"quantity", &intent.quantity},
                                       {"price", &intent.price},
                                       {"take_profit", &intent.take_profit},
                                       {"stop_loss", &intent.stop_loss},
                                       {"leverage", &intent.leverage}};
    for (const auto& field : optional_fields) {
        auto parsed = optional_number(j, field.name);
        if (parsed.is_error())
            return forward_error<OrderIntent>(parsed);
        if (parsed.value() && *parsed.value() <= 0.0) {
            return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT,
                                           std::string(field.name) + " must be positive",
                                           "OrderIntent");
        }
        *field.target = parsed.value();
    }

    auto win_rate = optional_number(j, "expected_win_rate");
    if (win_rate.is_error())
        return forward_error<OrderIntent>(win_rate);
    if (win_rate.value()) {
        if (*win_rate.value() < 0.0 || *win_rate.value() > 1.0) {
            return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT,
                                           "expected_win_rate must be within [0, 1]",
                                           "OrderIntent");
        }
        intent.expected_win_rate = *win_rate.value();
    }

    auto rr = optional_number(j, "reward_to_risk");
    if (rr.is_error())
        return forward_error<OrderIntent>(rr);
    if (rr.value()) {
        if (*rr.value() <= 0.0) {
            return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT,
                                           "reward_to_risk must be positive", "OrderIntent");
        }
        intent.reward_to_risk = *rr.value();
    }

    if (j.contains("client_metadata") && !j.at("client_metadata").is_null()) {
        if (!j.at("client_metadata").is_object()) {
            return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT,
                                           "client_metadata must be an object", "OrderIntent");
        }
        intent.client_metadata = j.at("client_metadata");
    }

    if (intent.order_type == OrderType::LIMIT && !intent.price) {
        return make_error<OrderIntent>(ErrorCode::INVALID_ARGUMENT, "LIMIT orders require price",
                                       "OrderIntent");
    }

    return intent;
}

nlohmann::json OrderIntent::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["side"] = side_to_string(side);
    j["type"] = order_type_to_string(order_type);
    j["notional"] = notional;
    if (quantity)
        j["quantity"] = *quantity;
    if (price)
        j["price"] = *price;
    if (take_profit)
        j["take_profit"] = *take_profit;
    if (stop_loss)
        j["stop_loss"] = *stop_loss;
    if (leverage)
        j["leverage"] = *leverage;
    j["expected_win_rate"] = expected_win_rate;
    j["reward_to_risk"] = reward_to_risk;
    j["client_metadata"] = client_metadata;
    return j;
}

std::optional<Price> OrderIntent::entry_price() const {
    if (price && *price > 0.0) {
        return price;
    }
    if (client_metadata.is_object() && client_metadata.contains("entry_price") &&
        client_metadata.at("entry_price").is_number()) {
        double p = client_metadata.at("entry_price").get<double>();
        if (p > 0.0) {
            return p;
        }
    }
    return std::nullopt;
}

std::optional<double> OrderIntent::stop_loss_pct() const {
    auto entry = entry_price();
    if (!entry || !stop_loss) {
        return std::nullopt;
    }
    return std::abs(*entry - *stop_loss) / *entry;
}

double OrderIntent::potential_loss() const {
    auto pct = stop_loss_pct();
    return pct ? notional * *pct : 0.0;
}

}  // namespace trade_guard
