// include/trade_guard/gateway/rest_exchange_gateway.hpp
#pragma once

#include <curl/curl.h>
#include <string>
#include <vector>
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/gateway/exchange_gateway.hpp"

namespace trade_guard {

struct RestGatewayConfig : public ConfigBase {
    std::string base_url{"http://127.0.0.1:8080"};
    std::string api_key;
    long connect_timeout_ms{2000};
    long request_timeout_ms{5000};
    std::string order_path{"/fapi/v1/order"};
    std::string cancel_all_path{"/fapi/v1/allOpenOrders"};
    std::string balance_path{"/fapi/v2/balance"};
    std::string position_risk_path{"/fapi/v2/positionRisk"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

/**
 * @brief ExchangeGateway over an execution-gateway REST service
 *
 * Sends JSON with an X-API-KEY header. HTTP 429 maps to RATE_LIMITED,
 * curl timeouts to TIMEOUT_ERROR, transport failures to CONNECTION_ERROR
 * and other non-2xx replies to API_ERROR (ORDER_REJECTED for 4xx on
 * order placement).
 */
class RestExchangeGateway : public ExchangeGateway {
public:
    explicit RestExchangeGateway(RestGatewayConfig config);
    ~RestExchangeGateway() override;

    RestExchangeGateway(const RestExchangeGateway&) = delete;
    RestExchangeGateway& operator=(const RestExchangeGateway&) = delete;

    Result<nlohmann::json> place_order(const nlohmann::json& payload) override;
    Result<void> cancel_all_orders(const std::string& symbol) override;
    Result<std::vector<AccountBalance>> account_balance() override;
    Result<std::vector<PositionRisk>> position_risk() override;

    /**
     * @brief Parse a balance report; numeric fields may be strings
     */
    static Result<std::vector<AccountBalance>> parse_balances(const nlohmann::json& body);
    static Result<std::vector<PositionRisk>> parse_positions(const nlohmann::json& body);

private:
    struct HttpResponse {
        long status{0};
        std::string body;
    };

    Result<HttpResponse> perform_request(const std::string& method, const std::string& path,
                                         const std::string& payload);
    Result<nlohmann::json> request_json(const std::string& method, const std::string& path,
                                        const std::string& payload, ErrorCode client_error);

    static size_t write_callback(void* contents, size_t size, size_t nmemb,
                                 std::string* user_data);

    RestGatewayConfig config_;
};

}  // namespace trade_guard
