// pairamm - Configuration
// Builder pattern for fluent configuration, JSON loading via nlohmann::json

#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace pairamm {

// Receipt execution settings
struct RuntimeConfig {
    Gas call_cost = TGAS;         // Charged to every executed call
    Gas max_gas = 300 * TGAS;     // Upper bound for a submitted transaction
};

// Budgets the pool attaches to its outbound calls
struct PoolConfig {
    Gas metadata_gas = TGAS;      // ft_metadata query
    Gas transfer_gas = TGAS;      // ft_transfer of the swap output
    Gas callback_gas = TGAS;      // metadata_callback / swap_callback
    Balance transfer_deposit = ONE_YOCTO;
};

class Config {
public:
    std::string log_level = "info";
    RuntimeConfig runtime;
    PoolConfig pool;

    Config() = default;

    // Load from JSON file; throws AMMError(INVALID_CONFIG)
    static Config from_file(std::string_view path);

    // Load from JSON string; absent keys keep their defaults
    static Config from_json(std::string_view content);

    // Throws AMMError(INVALID_CONFIG) when budgets cannot work together
    void validate() const;

    Config& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    Config& with_call_cost(Gas gas) {
        runtime.call_cost = gas;
        return *this;
    }

    Config& with_max_gas(Gas gas) {
        runtime.max_gas = gas;
        return *this;
    }

    Config& with_metadata_gas(Gas gas) {
        pool.metadata_gas = gas;
        return *this;
    }

    Config& with_transfer_gas(Gas gas) {
        pool.transfer_gas = gas;
        return *this;
    }

    Config& with_callback_gas(Gas gas) {
        pool.callback_gas = gas;
        return *this;
    }

    Config& with_transfer_deposit(Balance deposit) {
        pool.transfer_deposit = deposit;
        return *this;
    }
};

}  // namespace pairamm
