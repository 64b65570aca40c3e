// cardex scenario runner
//
// Replays a JSON scenario against an in-process Marketplace on a manual
// clock and writes the resulting event stream as JSON lines.

#include <cardex/clock.hpp>
#include <cardex/config.hpp>
#include <cardex/event_log.hpp>
#include <cardex/marketplace.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

using json = nlohmann::json;
using namespace cardex;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string scenario_path;
    std::string config_path;
    std::string events_path;
    bool verbose = false;
};

//------------------------------------------------------------------------------
// Scenario Runner
//------------------------------------------------------------------------------

class Runner {
public:
    Runner(Marketplace& market, ManualClock& clock, bool verbose)
        : market_(market), clock_(clock), verbose_(verbose)
    {
        handlers_["advance"] = [this](const json& s) { return advance(s); };
        handlers_["deposit"] = [this](const json& s) { return deposit(s); };
        handlers_["approve_spend"] = [this](const json& s) { return approve_spend(s); };
        handlers_["set_approval_for_all"] = [this](const json& s) { return set_approval_for_all(s); };
        handlers_["pause"] = [this](const json& s) { return market_.system().pause(address(s, "caller")); };
        handlers_["unpause"] = [this](const json& s) { return market_.system().unpause(address(s, "caller")); };
        handlers_["set_fee_recipient"] = [this](const json& s) {
            return market_.set_platform_fee_recipient(address(s, "caller"), address(s, "recipient"));
        };
        handlers_["withdraw"] = [this](const json& s) {
            return market_.payouts().withdraw(address(s, "caller"), currency(s));
        };

        handlers_["create_card_set"] = [this](const json& s) { return create_card_set(s); };
        handlers_["burn_card_set"] = [this](const json& s) {
            return market_.card_sets().burn_card_set(address(s, "caller"), s.at("set_id").get<uint64_t>());
        };
        handlers_["update_secret_salt"] = [this](const json& s) {
            return market_.card_sets().update_secret_salt(address(s, "caller"));
        };
        handlers_["mint"] = [this](const json& s) { return mint(s); };

        handlers_["create_listing"] = [this](const json& s) { return create_listing(s); };
        handlers_["cancel_listing"] = [this](const json& s) {
            return market_.listings().cancel_listing(address(s, "caller"), s.at("listing_id").get<uint64_t>());
        };
        handlers_["approve_buyer"] = [this](const json& s) {
            return market_.listings().approve_buyer_for_listing(
                address(s, "caller"), s.at("listing_id").get<uint64_t>(),
                address(s, "buyer"), s.value("approved", true));
        };
        handlers_["approve_currency"] = [this](const json& s) {
            return market_.listings().approve_currency_for_listing(
                address(s, "caller"), s.at("listing_id").get<uint64_t>(),
                currency(s), amount(s, "price"));
        };
        handlers_["buy_from_listing"] = [this](const json& s) { return buy_from_listing(s); };

        handlers_["create_auction"] = [this](const json& s) { return create_auction(s); };
        handlers_["bid"] = [this](const json& s) {
            return market_.auctions().bid_in_auction(
                address(s, "caller"), s.at("auction_id").get<uint64_t>(), amount(s, "amount"));
        };
        handlers_["collect_tokens"] = [this](const json& s) {
            return market_.auctions().collect_auction_tokens(address(s, "caller"), s.at("auction_id").get<uint64_t>());
        };
        handlers_["collect_payout"] = [this](const json& s) {
            return market_.auctions().collect_auction_payout(address(s, "caller"), s.at("auction_id").get<uint64_t>());
        };
        handlers_["cancel_auction"] = [this](const json& s) {
            return market_.auctions().cancel_auction(address(s, "caller"), s.at("auction_id").get<uint64_t>());
        };
        handlers_["withdraw_refund"] = [this](const json& s) {
            return market_.auctions().withdraw_refund(address(s, "caller"), s.at("auction_id").get<uint64_t>());
        };

        handlers_["create_dutch_auction"] = [this](const json& s) { return create_dutch_auction(s); };
        handlers_["dutch_price"] = [this](const json& s) { return dutch_price(s); };
        handlers_["dutch_buy"] = [this](const json& s) {
            return market_.dutch_auctions().buy(
                address(s, "caller"), s.at("auction_id").get<uint64_t>(), amount(s, "payment"));
        };
        handlers_["cancel_dutch_auction"] = [this](const json& s) {
            return market_.dutch_auctions().cancel_dutch_auction(
                address(s, "caller"), s.at("auction_id").get<uint64_t>());
        };
    }

    // Returns the number of steps whose result differed from "expect"
    int run(const json& steps) {
        int failures = 0;
        size_t index = 0;

        for (const auto& step : steps) {
            std::string op = step.at("op").get<std::string>();
            auto it = handlers_.find(op);
            if (it == handlers_.end()) {
                throw std::runtime_error("Unknown op at step " + std::to_string(index) + ": " + op);
            }

            int32_t code = it->second(step);
            std::string expected = step.value("expect", std::string("OK"));
            bool matched = expected == errors::name(code);

            if (!matched) {
                ++failures;
                std::cerr << "step " << index << " (" << op << "): expected " << expected
                          << ", got " << errors::name(code) << "\n";
            } else if (verbose_) {
                std::cerr << "step " << index << " (" << op << "): " << errors::name(code) << "\n";
            }
            ++index;
        }
        return failures;
    }

private:
    Marketplace& market_;
    ManualClock& clock_;
    bool verbose_;
    std::unordered_map<std::string, std::function<int32_t(const json&)>> handlers_;

    // "listings", "auctions", "dutch" name the component accounts
    Address address(const json& step, const char* key) const {
        std::string value = step.at(key).get<std::string>();
        if (value == "listings") return market_.listings().address();
        if (value == "auctions") return market_.auctions().address();
        if (value == "dutch") return market_.dutch_auctions().address();
        if (value == "card_sets") return market_.card_sets().address();
        return addresses::from_hex(value);
    }

    static Currency currency(const json& step) {
        std::string value = step.value("currency", std::string("native"));
        if (value == "native") return NATIVE;
        return Currency(addresses::from_hex(value));
    }

    static I128 amount(const json& step, const char* key) {
        if (!step.contains(key)) return 0;
        const json& value = step.at(key);
        if (value.is_string()) return parse_amount(value.get<std::string>());
        return static_cast<I128>(value.get<int64_t>());
    }

    void report_id(const char* what, uint64_t id) const {
        if (verbose_) std::cerr << "  " << what << " id " << id << "\n";
    }

    int32_t advance(const json& step) {
        clock_.advance(step.at("seconds").get<uint64_t>());
        return errors::OK;
    }

    int32_t deposit(const json& step) {
        return market_.vault().deposit(address(step, "account"), currency(step), amount(step, "amount"));
    }

    int32_t approve_spend(const json& step) {
        return market_.vault().approve(address(step, "owner"), address(step, "spender"),
                                       currency(step), amount(step, "amount"));
    }

    int32_t set_approval_for_all(const json& step) {
        market_.tokens().set_approval_for_all(address(step, "owner"), address(step, "operator"),
                                              step.value("approved", true));
        return errors::OK;
    }

    int32_t create_card_set(const json& step) {
        CreateResult result = market_.card_sets().create_card_set(
            address(step, "caller"), step.at("name").get<std::string>(),
            step.at("card_uris").get<std::vector<std::string>>(),
            step.at("probabilities").get<std::vector<uint32_t>>(),
            step.at("supply").get<uint64_t>(), amount(step, "price"));
        if (result.error_code == errors::OK) report_id("card set", result.id);
        return result.error_code;
    }

    int32_t mint(const json& step) {
        MintResult result = market_.card_sets().mint_from_card_set(
            address(step, "caller"), step.at("set_id").get<uint64_t>(), amount(step, "payment"));
        if (result.error_code == errors::OK && verbose_) {
            std::cerr << "  minted token " << result.token_id << " (" << result.uri << ")\n";
        }
        return result.error_code;
    }

    int32_t create_listing(const json& step) {
        ListingParams params;
        params.token_id = step.at("token_id").get<uint64_t>();
        params.quantity = step.value("quantity", uint64_t{1});
        params.currency = currency(step);
        params.price_per_token_x18 = amount(step, "price");
        params.start_time = step.value("start_time", uint64_t{0});
        params.end_time = clock_.now() + step.at("duration").get<uint64_t>();
        params.reserved = step.value("reserved", false);

        CreateResult result = market_.listings().create_listing(address(step, "caller"), params);
        if (result.error_code == errors::OK) report_id("listing", result.id);
        return result.error_code;
    }

    int32_t buy_from_listing(const json& step) {
        Address caller = address(step, "caller");
        Address buyer = step.contains("buyer") ? address(step, "buyer") : caller;
        return market_.listings().buy_from_listing(
            caller, step.at("listing_id").get<uint64_t>(), buyer,
            step.value("quantity", uint64_t{1}), currency(step),
            amount(step, "expected"), amount(step, "payment"));
    }

    int32_t create_auction(const json& step) {
        AuctionParams params;
        params.token_id = step.at("token_id").get<uint64_t>();
        params.quantity = step.value("quantity", uint64_t{1});
        params.currency = currency(step);
        params.min_bid_x18 = amount(step, "min_bid");
        params.buyout_bid_x18 = amount(step, "buyout_bid");
        params.time_buffer = step.value("time_buffer", uint64_t{300});
        params.bid_buffer_bps = step.value("bid_buffer_bps", uint32_t{500});
        params.start_time = step.value("start_time", uint64_t{0});
        params.end_time = clock_.now() + step.at("duration").get<uint64_t>();

        CreateResult result = market_.auctions().create_auction(address(step, "caller"), params);
        if (result.error_code == errors::OK) report_id("auction", result.id);
        return result.error_code;
    }

    int32_t create_dutch_auction(const json& step) {
        CreateResult result = market_.dutch_auctions().create_dutch_auction(
            address(step, "caller"), step.at("token_id").get<uint64_t>(),
            amount(step, "start_price"), amount(step, "end_price"),
            step.at("duration").get<uint64_t>(), step.value("decay_exponent", uint32_t{1}),
            currency(step));
        if (result.error_code == errors::OK) report_id("dutch auction", result.id);
        return result.error_code;
    }

    int32_t dutch_price(const json& step) {
        I128 price = 0;
        int32_t result = market_.dutch_auctions().get_current_price(
            step.at("auction_id").get<uint64_t>(), price);
        if (result == errors::OK) {
            std::cerr << "  current price " << to_string(price) << "\n";
        }
        return result;
    }
};

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "cardex scenario runner\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  Engine config (overrides the scenario's \"config\")\n"
              << "  -o, --events <file>  Write JSON-lines events to file (default: stdout)\n"
              << "  -v, --verbose        Report every step on stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Each step is {\"op\": ..., ...} with an optional \"expect\" error name\n"
              << "(default \"OK\"). The exit status is 1 if any step differs.\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-o" || arg == "--events") {
            if (i + 1 >= argc) {
                std::cerr << "Missing events argument\n";
                std::exit(1);
            }
            options.events_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

json load_scenario(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        json scenario = load_scenario(options.scenario_path);

        Config config = !options.config_path.empty()
            ? Config::from_file(options.config_path)
            : Config::from_json(scenario.at("config").dump());

        ManualClock clock(scenario.value("start_time", uint64_t{1700000000}));
        Marketplace market(config, clock);

        std::ofstream events_file;
        if (!options.events_path.empty()) {
            events_file.open(options.events_path);
            if (!events_file.is_open()) {
                std::cerr << "Cannot open events file: " << options.events_path << "\n";
                return 1;
            }
        }
        JsonEventLog log(options.events_path.empty() ? std::cout : events_file);
        market.set_listener(&log);

        Runner runner(market, clock, options.verbose);
        int failures = runner.run(scenario.at("steps"));

        if (options.verbose) {
            std::cerr << log.events_written() << " events, " << failures << " mismatches\n";
        }
        return failures == 0 ? 0 : 1;
    } catch (const json::exception& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
