#ifndef INDICATOR_INTERFACE_HPP
#define INDICATOR_INTERFACE_HPP

#include <memory>
#include <string>

namespace RegimeTrader {
namespace Core {

// Streaming indicator fed one close per bar.
class Indicator {
public:
    virtual ~Indicator() = default;

    // Returns true when the indicator is ready after consuming the sample
    virtual bool update(double input_value) = 0;
    virtual bool is_ready() const = 0;
    virtual void reset() = 0;
    virtual double value() const = 0;

    virtual std::string get_name() const = 0;
    virtual int warm_up_period() const = 0;
};

// Indicator that also publishes an upper and lower price bound.
class ChannelIndicator : public Indicator {
public:
    virtual double upper_band() const = 0;
    virtual double lower_band() const = 0;
    virtual double middle_band() const = 0;
};

using IndicatorPtr = std::unique_ptr<Indicator>;
using ChannelIndicatorPtr = std::unique_ptr<ChannelIndicator>;

} // namespace Core
} // namespace RegimeTrader

#endif // INDICATOR_INTERFACE_HPP
