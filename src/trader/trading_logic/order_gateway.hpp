#ifndef ORDER_GATEWAY_HPP
#define ORDER_GATEWAY_HPP

#include <memory>
#include <string>

namespace RegimeTrader {
namespace Core {

// Host side of order execution. Calls are synchronous within one bar.
class OrderGateway {
public:
    virtual ~OrderGateway() = default;

    // Market order for a signed quantity (positive buys). Returns the signed filled quantity.
    virtual double place_order(double signed_quantity, const std::string& order_tag) = 0;

    // Share quantity for a signed fraction of tradable capital (0.5 = half of equity).
    virtual double size_order(double target_allocation) const = 0;
};

using OrderGatewayPtr = std::unique_ptr<OrderGateway>;

} // namespace Core
} // namespace RegimeTrader

#endif // ORDER_GATEWAY_HPP
