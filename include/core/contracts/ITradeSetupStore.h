#pragma once

#include <optional>
#include <vector>

#include "strategy/TradeSetup.h"

namespace tugofwar {
namespace core {

class ITradeSetupStore {
public:
    virtual ~ITradeSetupStore() = default;

    virtual bool create(const strategy::TradeSetup& setup) = 0;
    virtual bool update(const strategy::TradeSetup& setup) = 0;
    virtual std::optional<strategy::TradeSetup> findById(long long id) const = 0;
    virtual std::vector<strategy::TradeSetup> list() const = 0;
};

} // namespace core
} // namespace tugofwar
