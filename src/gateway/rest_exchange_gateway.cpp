// src/gateway/rest_exchange_gateway.cpp
#include "trade_guard/gateway/rest_exchange_gateway.hpp"
#include <stdexcept>
#include "trade_guard/core/logger.hpp"

namespace trade_guard {

namespace {

double number_field(const nlohmann::json& entry, const char* key) {
    if (!entry.contains(key)) {
        return 0.0;
    }
    const auto& value = entry.at(key);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    throw std::invalid_argument(std::string("Field is not numeric: ") + key);
}

}  // namespace

nlohmann::json RestGatewayConfig::to_json() const {
    nlohmann::json j;
    j["base_url"] = base_url;
    j["connect_timeout_ms"] = connect_timeout_ms;
    j["request_timeout_ms"] = request_timeout_ms;
    j["order_path"] = order_path;
    j["cancel_all_path"] = cancel_all_path;
    j["balance_path"] = balance_path;
    j["position_risk_path"] = position_risk_path;
    // api_key is never serialized
    return j;
}

void RestGatewayConfig::from_json(const nlohmann::json& j) {
    if (j.contains("base_url"))
        base_url = j.at("base_url").get<std::string>();
    if (j.contains("api_key"))
        api_key = j.at("api_key").get<std::string>();
    if (j.contains("connect_timeout_ms"))
        connect_timeout_ms = j.at("connect_timeout_ms").get<long>();
    if (j.contains("request_timeout_ms"))
        request_timeout_ms = j.at("request_timeout_ms").get<long>();
    if (j.contains("order_path"))
        order_path = j.at("order_path").get<std::string>();
    if (j.contains("cancel_all_path"))
        cancel_all_path = j.at("cancel_all_path").get<std::string>();
    if (j.contains("balance_path"))
        balance_path = j.at("balance_path").get<std::string>();
    if (j.contains("position_risk_path"))
        position_risk_path = j.at("position_risk_path").get<std::string>();
}

std::vector<std::string> RestGatewayConfig::validate() const {
    std::vector<std::string> problems;
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0)
        problems.push_back("gateway base_url must start with http:// or https://");
    if (connect_timeout_ms <= 0 || request_timeout_ms <= 0)
        problems.push_back("gateway timeouts must be positive");
    return problems;
}

RestExchangeGateway::RestExchangeGateway(RestGatewayConfig config) : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    Logger::register_component("RestExchangeGateway");
}

RestExchangeGateway::~RestExchangeGateway() {
    curl_global_cleanup();
}

size_t RestExchangeGateway::write_callback(void* contents, size_t size, size_t nmemb,
                                           std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Result<RestExchangeGateway::HttpResponse> RestExchangeGateway::perform_request(
    const std::string& method, const std::string& path, const std::string& payload) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                        "RestExchangeGateway");
    }

    HttpResponse response;
    std::string url = config_.base_url + path;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!config_.api_key.empty()) {
        headers = curl_slist_append(headers, ("X-API-KEY: " + config_.api_key).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, RestExchangeGateway::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config_.request_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    } else if (method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(ErrorCode::TIMEOUT_ERROR,
                                        method + " " + path + " timed out",
                                        "RestExchangeGateway");
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(
            ErrorCode::CONNECTION_ERROR,
            method + " " + path + " failed: " + std::string(curl_easy_strerror(res)),
            "RestExchangeGateway");
    }
    return response;
}

Result<nlohmann::json> RestExchangeGateway::request_json(const std::string& method,
                                                         const std::string& path,
                                                         const std::string& payload,
                                                         ErrorCode client_error) {
    auto response = perform_request(method, path, payload);
    if (response.is_error()) {
        return forward_error<nlohmann::json>(response);
    }

    const auto& http = response.value();
    if (http.status == 429) {
        return make_error<nlohmann::json>(ErrorCode::RATE_LIMITED,
                                          method + " " + path + " rate limited (HTTP 429)",
                                          "RestExchangeGateway");
    }
    if (http.status < 200 || http.status >= 300) {
        ErrorCode code = (http.status >= 400 && http.status < 500) ? client_error
                                                                   : ErrorCode::API_ERROR;
        return make_error<nlohmann::json>(
            code, method + " " + path + " returned HTTP " + std::to_string(http.status) + ": " +
                      http.body,
            "RestExchangeGateway");
    }

    if (http.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(http.body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          method + " " + path + " returned invalid JSON: " +
                                              e.what(),
                                          "RestExchangeGateway");
    }
}

Result<nlohmann::json> RestExchangeGateway::place_order(const nlohmann::json& payload) {
    auto result = request_json("POST", config_.order_path, payload.dump(),
                               ErrorCode::ORDER_REJECTED);
    if (result.is_error()) {
        ERROR("Order placement failed: " << result.error()->what());
    }
    return result;
}

Result<void> RestExchangeGateway::cancel_all_orders(const std::string& symbol) {
    char* escaped = curl_easy_escape(nullptr, symbol.c_str(), static_cast<int>(symbol.size()));
    if (!escaped) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Cannot encode symbol: " + symbol,
                                "RestExchangeGateway");
    }
    std::string path = config_.cancel_all_path + "?symbol=" + escaped;
    curl_free(escaped);

    auto result = request_json("DELETE", path, "", ErrorCode::API_ERROR);
    if (result.is_error()) {
        return forward_error<void>(result);
    }
    return Result<void>();
}

Result<std::vector<AccountBalance>> RestExchangeGateway::account_balance() {
    auto body = request_json("GET", config_.balance_path, "", ErrorCode::API_ERROR);
    if (body.is_error()) {
        return forward_error<std::vector<AccountBalance>>(body);
    }
    return parse_balances(body.value());
}

Result<std::vector<PositionRisk>> RestExchangeGateway::position_risk() {
    auto body = request_json("GET", config_.position_risk_path, "", ErrorCode::API_ERROR);
    if (body.is_error()) {
        return forward_error<std::vector<PositionRisk>>(body);
    }
    return parse_positions(body.value());
}

Result<std::vector<AccountBalance>> RestExchangeGateway::parse_balances(
    const nlohmann::json& body) {
    if (!body.is_array()) {
        return make_error<std::vector<AccountBalance>>(
            ErrorCode::INVALID_DATA, "Balance report is not an array", "RestExchangeGateway");
    }

    std::vector<AccountBalance> balances;
    try {
        for (const auto& entry : body) {
            AccountBalance b;
            b.asset = entry.value("asset", "");
            b.balance = number_field(entry, "balance");
            b.available_balance = number_field(entry, "availableBalance");
            balances.push_back(b);
        }
    } catch (const std::exception& e) {
        return make_error<std::vector<AccountBalance>>(
            ErrorCode::INVALID_DATA, "Malformed balance entry: " + std::string(e.what()),
            "RestExchangeGateway");
    }
    return balances;
}

Result<std::vector<PositionRisk>> RestExchangeGateway::parse_positions(
    const nlohmann::json& body) {
    if (!body.is_array()) {
        return make_error<std::vector<PositionRisk>>(
            ErrorCode::INVALID_DATA, "Position report is not an array", "RestExchangeGateway");
    }

    std::vector<PositionRisk> positions;
    try {
        for (const auto& entry : body) {
            PositionRisk p;
            p.symbol = entry.value("symbol", "");
            p.position_amt = number_field(entry, "positionAmt");
            p.entry_price = number_field(entry, "entryPrice");
            p.mark_price = number_field(entry, "markPrice");
            p.unrealized_profit = number_field(entry, "unRealizedProfit");
            if (entry.contains("leverage"))
                p.leverage = number_field(entry, "leverage");
            positions.push_back(p);
        }
    } catch (const std::exception& e) {
        return make_error<std::vector<PositionRisk>>(
            ErrorCode::INVALID_DATA, "Malformed position entry: " + std::string(e.what()),
            "RestExchangeGateway");
    }
    return positions;
}

}  // namespace trade_guard
