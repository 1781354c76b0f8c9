// pairamm - Configuration Implementation

#include "pairamm/config.hpp"
#include "pairamm/log.hpp"

#include <fstream>
#include <sstream>

namespace pairamm {

namespace {

const json& section_of(const json& root, const char* key) {
    const json& section = root.at(key);
    if (!section.is_object()) {
        throw AMMError(errors::INVALID_CONFIG, std::string(key) + " must be an object");
    }
    return section;
}

Gas tgas_field(const json& section, const char* key, Gas fallback) {
    auto it = section.find(key);
    if (it == section.end()) return fallback;
    if (!it->is_number_unsigned()) {
        throw AMMError(errors::INVALID_CONFIG, std::string(key) + " must be an unsigned integer");
    }
    uint64_t tgas = it->get<uint64_t>();
    if (tgas > UINT64_MAX / TGAS) {
        throw AMMError(errors::INVALID_CONFIG, std::string(key) + " is out of range");
    }
    return tgas * TGAS;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw AMMError(errors::INVALID_CONFIG, "cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw AMMError(errors::INVALID_CONFIG, e.what());
    }
    if (!root.is_object()) {
        throw AMMError(errors::INVALID_CONFIG, "top level must be an object");
    }

    try {
        if (root.contains("log_level")) {
            config.log_level = root.at("log_level").get<std::string>();
            log::parse_level(config.log_level);
        }

        if (root.contains("runtime")) {
            const json& rt = section_of(root, "runtime");
            config.runtime.call_cost = tgas_field(rt, "call_cost_tgas", config.runtime.call_cost);
            config.runtime.max_gas = tgas_field(rt, "max_gas_tgas", config.runtime.max_gas);
        }

        if (root.contains("pool")) {
            const json& pool = section_of(root, "pool");
            config.pool.metadata_gas = tgas_field(pool, "metadata_gas_tgas", config.pool.metadata_gas);
            config.pool.transfer_gas = tgas_field(pool, "transfer_gas_tgas", config.pool.transfer_gas);
            config.pool.callback_gas = tgas_field(pool, "callback_gas_tgas", config.pool.callback_gas);
            if (pool.contains("transfer_deposit")) {
                auto deposit = parse_u128(pool.at("transfer_deposit").get<std::string>());
                if (!deposit) {
                    throw AMMError(errors::INVALID_CONFIG, "transfer_deposit must be a U128 string");
                }
                config.pool.transfer_deposit = *deposit;
            }
        }
    } catch (const json::exception& e) {
        throw AMMError(errors::INVALID_CONFIG, e.what());
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (runtime.call_cost == 0 || runtime.call_cost > runtime.max_gas) {
        throw AMMError(errors::INVALID_CONFIG, "call cost must be in (0, max_gas]");
    }
    // Every outbound call has to at least pay for its own execution
    if (pool.metadata_gas < runtime.call_cost ||
        pool.transfer_gas < runtime.call_cost ||
        pool.callback_gas < runtime.call_cost) {
        throw AMMError(errors::INVALID_CONFIG, "pool gas budgets must cover the call cost");
    }
}

}  // namespace pairamm
