// =============================================================================
// config.cpp - Configuration loading
// =============================================================================

#include "cardex/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cardex {

using json = nlohmann::json;

namespace {

Address parse_address(const json& value, const char* key) {
    if (!value.is_string()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be a hex string");
    }
    try {
        return addresses::from_hex(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Config: ") + key + ": " + e.what());
    }
}

uint32_t parse_fee(const json& fees, const char* key, uint32_t fallback) {
    if (!fees.contains(key)) return fallback;

    const json& value = fees.at(key);
    if (!value.is_number_unsigned() || value.get<uint64_t>() > bps::MAX_FEE) {
        throw std::runtime_error(std::string("Config: fees.") + key + " must be 0..10000");
    }
    return value.get<uint32_t>();
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Config: invalid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Config: top level must be an object");
    }
    if (!doc.contains("admin")) {
        throw std::runtime_error("Config: admin is required");
    }

    Config config;
    config.admin = parse_address(doc.at("admin"), "admin");
    if (addresses::is_zero(config.admin)) {
        throw std::runtime_error("Config: admin must not be the zero address");
    }

    if (doc.contains("fee_recipient")) {
        config.fee_recipient = parse_address(doc.at("fee_recipient"), "fee_recipient");
    }

    if (doc.contains("fees")) {
        const json& fees = doc.at("fees");
        if (!fees.is_object()) {
            throw std::runtime_error("Config: fees must be an object");
        }
        config.listing_fee_bps = parse_fee(fees, "listing_bps", config.listing_fee_bps);
        config.auction_fee_bps = parse_fee(fees, "auction_bps", config.auction_fee_bps);
        config.dutch_fee_bps = parse_fee(fees, "dutch_bps", config.dutch_fee_bps);
    }

    if (doc.contains("salt_seed")) {
        if (!doc.at("salt_seed").is_string()) {
            throw std::runtime_error("Config: salt_seed must be a string");
        }
        config.salt_seed = doc.at("salt_seed").get<std::string>();
    }

    return config;
}

std::string Config::to_json() const {
    json doc = {
        {"admin", addresses::to_hex(admin)},
        {"fees", {
            {"listing_bps", listing_fee_bps},
            {"auction_bps", auction_fee_bps},
            {"dutch_bps", dutch_fee_bps}
        }},
        {"salt_seed", salt_seed}
    };
    if (fee_recipient) {
        doc["fee_recipient"] = addresses::to_hex(*fee_recipient);
    }
    return doc.dump(2);
}

} // namespace cardex
