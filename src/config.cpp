// cpmm - Pool Configuration Implementation

#include <cpmm/config.hpp>
#include <cpmm/logging.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cpmm {

namespace {

// Amounts may be given as a JSON string (full 128-bit range) or number
U128 read_amount(const nlohmann::json& value, const char* key) {
    if (value.is_string()) {
        return parse_u128(value.get<std::string>());
    }
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    throw std::invalid_argument(std::string("config: '") + key +
                                "' must be an unsigned integer or decimal string");
}

}  // namespace

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

PoolConfig PoolConfig::from_json(std::string_view content) {
    PoolConfig config;

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("config: malformed JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("config: top level must be an object");
    }

    try {
        if (auto pool = root.find("pool"); pool != root.end()) {
            if (auto it = pool->find("address"); it != pool->end()) {
                config.pool_address = address_from_hex(it->get<std::string>());
            }
            if (auto it = pool->find("seed_shares"); it != pool->end()) {
                config.seed_shares = read_amount(*it, "seed_shares");
            }
            if (auto it = pool->find("ratio_tolerance_divisor"); it != pool->end()) {
                config.ratio_tolerance_divisor = read_amount(*it, "ratio_tolerance_divisor");
            }
            if (auto it = pool->find("reseed_on_empty"); it != pool->end()) {
                config.reseed_on_empty = it->get<bool>();
            }
        }

        if (auto log = root.find("logging"); log != root.end()) {
            if (auto it = log->find("level"); it != log->end()) {
                config.log_level = it->get<std::string>();
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("config: wrong value type: ") + e.what());
    }

    config.validate();
    return config;
}

void PoolConfig::validate() const {
    if (seed_shares == 0) {
        throw std::invalid_argument("config: seed_shares must be positive");
    }
    if (ratio_tolerance_divisor == 0) {
        throw std::invalid_argument("config: ratio_tolerance_divisor must be positive");
    }
    if (addresses::is_zero(pool_address)) {
        throw std::invalid_argument("config: pool address must not be zero");
    }
    if (!log_level.empty() && !logging::is_level_name(log_level)) {
        throw std::invalid_argument("config: unknown log level: " + log_level);
    }
}

}  // namespace cpmm
