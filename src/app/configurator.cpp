/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/bytes.hpp>
#include <qtils/unhex.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

using Endpoint = boost::asio::ip::tcp::endpoint;

OUTCOME_CPP_DEFINE_CATEGORY(raffle::app, Configurator::Error, e) {
  using E = raffle::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  template <typename T>
  std::optional<T> parse_number(std::string_view input) {
    input = raffle::util::trim(input);
    T value{};
    const auto *end = input.data() + input.size();
    auto [ptr, ec] = std::from_chars(input.data(), end, value);
    if (ec != std::errc() or ptr != end) {
      return std::nullopt;
    }
    return value;
  }

  std::optional<raffle::GasLane> parse_gas_lane(std::string_view input) {
    input = raffle::util::trim(input);
    qtils::ByteVec bytes;
    if (not qtils::unhex0x(bytes, input, true).has_value()
        or bytes.size() != raffle::GasLane::size()) {
      return std::nullopt;
    }
    raffle::GasLane gas_lane;
    std::ranges::copy(bytes, gas_lane.begin());
    return gas_lane;
  }

  /**
   * Reads scalar `section.key` and passes its text to `apply`.
   * `apply` returns false when the text is not an acceptable value.
   */
  template <typename Func>
  void read_scalar(const YAML::Node &section,
                   std::string_view section_name,
                   const char *key,
                   std::ostringstream &errors,
                   bool &has_error,
                   Func &&apply) {
    auto node = section[key];
    if (not node.IsDefined()) {
      return;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << "." << key
             << "' must be scalar\n";
      has_error = true;
      return;
    }
    if (not std::forward<Func>(apply)(node.as<std::string>())) {
      errors << "E: Value '" << section_name << "." << key
             << "' has invalid value\n";
      has_error = true;
    }
  }

  bool parse_bool(const std::string &value, bool &out) {
    if (value == "true") {
      out = true;
      return true;
    }
    if (value == "false") {
      out = false;
      return true;
    }
    return false;
  }

  void bad_option(std::string_view option) {
    std::cerr << "Option --" << option << " has invalid value\n"
              << "Try run with option '--help' for more information\n";
  }

  // Key hash of the development network gas lane
  constexpr std::string_view kDefaultGasLane =
      "0x474e34a077df58807dbe9c96d3c009b23b3c6d0cce433e59bbf5b34f823bc56c";

}  // namespace

namespace raffle::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";
    config_->base_path_ = std::filesystem::current_path();

    // 0.01 ether
    config_->raffle_.entrance_fee = Amount{10'000'000'000'000'000ull};
    config_->raffle_.interval = std::chrono::seconds{30};
    config_->raffle_.gas_lane = parse_gas_lane(kDefaultGasLane).value();
    config_->raffle_.subscription_id = 1;
    config_->raffle_.request_confirmations = 3;
    config_->raffle_.callback_gas_limit = 500'000;

    // 0.25 LINK premium, 1e9 juels per gas, 100 LINK funding
    config_->oracle_.base_fee = Amount{250'000'000'000'000'000ull};
    config_->oracle_.gas_price_link = Amount{1'000'000'000ull};
    config_->oracle_.subscription_fund =
        Amount{100} * Amount{1'000'000'000'000'000'000ull};

    config_->metrics_.enabled = std::nullopt;

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lkeeper=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description raffle_options("Raffle options");
    raffle_options.add_options()
        ("entrance-fee", po::value<std::string>(), "Minimal stake to enter, e.g. 100, 5 gwei, 0.01 ether. Default: 0.01 ether.")
        ("interval", po::value<std::string>(), "Minimal time between draws, e.g. 30s, 500ms, 2m. Default: 30s.")
        ("gas-lane", po::value<std::string>(), "Key hash of the randomness gas lane (0x-prefixed 32 bytes).")
        ("subscription-id", po::value<uint64_t>(), "Randomness subscription id. Default: 1.")
        ("request-confirmations", po::value<uint16_t>(), "Confirmations the oracle waits for. Default: 3.")
        ("callback-gas-limit", po::value<uint32_t>(), "Compute budget of the fulfillment callback. Default: 500000.")
        ;

    po::options_description keeper_options("Keeper options");
    keeper_options.add_options()
        ("keeper-disable", "Set to disable the built-in upkeep keeper.")
        ("keeper-period", po::value<std::string>(), "Period of upkeep checks. Default: 1s.")
        ;

    po::options_description oracle_options("Oracle options");
    oracle_options.add_options()
        ("oracle-base-fee", po::value<std::string>(), "Flat fee charged per fulfillment. Default: 0.25 link.")
        ("oracle-gas-price", po::value<std::string>(), "Fee charged per unit of callback gas. Default: 1 gwei.")
        ("fulfillment-delay", po::value<std::string>(), "Delay between a draw request and its fulfillment. Default: 2s.")
        ("subscription-fund", po::value<std::string>(), "Initial funding of the randomness subscription. Default: 100 link.")
        ;

    po::options_description payment_options("Payment options");
    payment_options.add_options()
        ("reject-recipient", po::value<std::vector<std::string>>(), "Address whose incoming transfers fail. Can be repeated.")
        ;

    po::options_description api_options("API options");
    api_options.add_options()
        ("api-host", po::value<std::string>(), "Set address of HTTP API. Default: 127.0.0.1.")
        ("api-port", po::value<uint16_t>(), "Set port of HTTP API. Default: 9650.")
        ;

    po::options_description metrics_options("Metric options");
    metrics_options.add_options()
        ("prometheus_disable", "Set to disable OpenMetrics.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(raffle_options)
        .add(keeper_options)
        .add(oracle_options)
        .add(payment_options)
        .add(api_options)
        .add(metrics_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Raffle-node version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Raffle-node version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: raffle
        children:
          - name: application
          - name: randomness
          - name: payment
          - name: keeper
          - name: http
          - name: metrics
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initRaffleConfig());
    OUTCOME_TRY(initKeeperConfig());
    OUTCOME_TRY(initOracleConfig());
    OUTCOME_TRY(initPaymentConfig());
    OUTCOME_TRY(initApiConfig());
    OUTCOME_TRY(initOpenMetricsConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto name = section["name"];
          if (name.IsDefined()) {
            if (name.IsScalar()) {
              auto value = name.as<std::string>();
              config_->name_ = value;
            } else {
              file_errors_ << "E: Value 'general.name' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto base_path = section["base-path"];
          if (base_path.IsDefined()) {
            if (base_path.IsScalar()) {
              auto value = base_path.as<std::string>();
              config_->base_path_ = value;
            } else {
              file_errors_ << "E: Value 'general.base-path' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    if (not config_->base_path_.is_absolute()) {
      config_->base_path_ = std::filesystem::absolute(config_->base_path_);
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    current_path(config_->base_path_);

    return outcome::success();
  }

  outcome::result<void> Configurator::initRaffleConfig() {
    auto &raffle = config_->raffle_;

    if (config_file_.has_value()) {
      auto section = (*config_file_)["raffle"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto read = [&](const char *key, auto &&apply) {
            read_scalar(section,
                        "raffle",
                        key,
                        file_errors_,
                        file_has_error_,
                        std::forward<decltype(apply)>(apply));
          };
          read("entrance-fee", [&](const std::string &value) {
            auto fee = util::parseAmount(value);
            if (fee.has_value()) {
              raffle.entrance_fee = fee.value();
            }
            return fee.has_value();
          });
          read("interval", [&](const std::string &value) {
            auto interval = util::parseDuration(value);
            if (interval.has_value()) {
              raffle.interval = interval.value();
            }
            return interval.has_value();
          });
          read("gas-lane", [&](const std::string &value) {
            auto gas_lane = parse_gas_lane(value);
            if (gas_lane.has_value()) {
              raffle.gas_lane = gas_lane.value();
            }
            return gas_lane.has_value();
          });
          read("subscription-id", [&](const std::string &value) {
            auto id = parse_number<SubscriptionId>(value);
            if (id.has_value()) {
              raffle.subscription_id = id.value();
            }
            return id.has_value();
          });
          read("request-confirmations", [&](const std::string &value) {
            auto confirmations = parse_number<uint16_t>(value);
            if (confirmations.has_value()) {
              raffle.request_confirmations = confirmations.value();
            }
            return confirmations.has_value();
          });
          read("callback-gas-limit", [&](const std::string &value) {
            auto gas_limit = parse_number<uint32_t>(value);
            if (gas_limit.has_value()) {
              raffle.callback_gas_limit = gas_limit.value();
            }
            return gas_limit.has_value();
          });
        } else {
          file_errors_ << "E: Section 'raffle' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "entrance-fee", [&](const std::string &value) {
          if (auto fee = util::parseAmount(value); fee.has_value()) {
            raffle.entrance_fee = fee.value();
          } else {
            bad_option("entrance-fee");
            fail = true;
          }
        });
    find_argument<std::string>(
        cli_values_map_, "interval", [&](const std::string &value) {
          if (auto interval = util::parseDuration(value); interval.has_value()) {
            raffle.interval = interval.value();
          } else {
            bad_option("interval");
            fail = true;
          }
        });
    find_argument<std::string>(
        cli_values_map_, "gas-lane", [&](const std::string &value) {
          if (auto gas_lane = parse_gas_lane(value); gas_lane.has_value()) {
            raffle.gas_lane = gas_lane.value();
          } else {
            bad_option("gas-lane");
            fail = true;
          }
        });
    find_argument<uint64_t>(
        cli_values_map_, "subscription-id", [&](uint64_t value) {
          raffle.subscription_id = value;
        });
    find_argument<uint16_t>(
        cli_values_map_, "request-confirmations", [&](uint16_t value) {
          raffle.request_confirmations = value;
        });
    find_argument<uint32_t>(
        cli_values_map_, "callback-gas-limit", [&](uint32_t value) {
          raffle.callback_gas_limit = value;
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (raffle.entrance_fee == 0) {
      SL_ERROR(logger_, "The 'entrance-fee' must be positive");
      return Error::InvalidValue;
    }
    if (raffle.interval.count() <= 0) {
      SL_ERROR(logger_, "The 'interval' must be positive");
      return Error::InvalidValue;
    }
    if (raffle.callback_gas_limit == 0) {
      SL_ERROR(logger_, "The 'callback-gas-limit' must be positive");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initKeeperConfig() {
    auto &keeper = config_->keeper_;

    if (config_file_.has_value()) {
      auto section = (*config_file_)["keeper"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          read_scalar(section,
                      "keeper",
                      "enabled",
                      file_errors_,
                      file_has_error_,
                      [&](const std::string &value) {
                        return parse_bool(value, keeper.enabled);
                      });
          read_scalar(section,
                      "keeper",
                      "period",
                      file_errors_,
                      file_has_error_,
                      [&](const std::string &value) {
                        auto period = util::parseDuration(value);
                        if (period.has_value()) {
                          keeper.period = period.value();
                        }
                        return period.has_value();
                      });
        } else {
          file_errors_ << "E: Section 'keeper' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    bool fail = false;
    if (find_argument(cli_values_map_, "keeper-disable")) {
      keeper.enabled = false;
    }
    find_argument<std::string>(
        cli_values_map_, "keeper-period", [&](const std::string &value) {
          if (auto period = util::parseDuration(value); period.has_value()) {
            keeper.period = period.value();
          } else {
            bad_option("keeper-period");
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    if (keeper.period.count() <= 0) {
      SL_ERROR(logger_, "The 'keeper.period' must be positive");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initOracleConfig() {
    auto &oracle = config_->oracle_;

    auto amount_setter = [](Amount &target) {
      return [&target](const std::string &value) {
        auto amount = util::parseAmount(value);
        if (amount.has_value()) {
          target = amount.value();
        }
        return amount.has_value();
      };
    };

    if (config_file_.has_value()) {
      auto section = (*config_file_)["oracle"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          read_scalar(section,
                      "oracle",
                      "base-fee",
                      file_errors_,
                      file_has_error_,
                      amount_setter(oracle.base_fee));
          read_scalar(section,
                      "oracle",
                      "gas-price-link",
                      file_errors_,
                      file_has_error_,
                      amount_setter(oracle.gas_price_link));
          read_scalar(section,
                      "oracle",
                      "subscription-fund",
                      file_errors_,
                      file_has_error_,
                      amount_setter(oracle.subscription_fund));
          read_scalar(section,
                      "oracle",
                      "fulfillment-delay",
                      file_errors_,
                      file_has_error_,
                      [&](const std::string &value) {
                        auto delay = util::parseDuration(value);
                        if (delay.has_value()) {
                          oracle.fulfillment_delay = delay.value();
                        }
                        return delay.has_value();
                      });
        } else {
          file_errors_ << "E: Section 'oracle' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    bool fail = false;
    auto amount_option = [&](const char *name, Amount &target) {
      find_argument<std::string>(
          cli_values_map_, name, [&](const std::string &value) {
            if (not amount_setter(target)(value)) {
              bad_option(name);
              fail = true;
            }
          });
    };
    amount_option("oracle-base-fee", oracle.base_fee);
    amount_option("oracle-gas-price", oracle.gas_price_link);
    amount_option("subscription-fund", oracle.subscription_fund);
    find_argument<std::string>(
        cli_values_map_, "fulfillment-delay", [&](const std::string &value) {
          if (auto delay = util::parseDuration(value); delay.has_value()) {
            oracle.fulfillment_delay = delay.value();
          } else {
            bad_option("fulfillment-delay");
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initPaymentConfig() {
    auto &payment = config_->payment_;

    if (config_file_.has_value()) {
      auto section = (*config_file_)["payment"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto rejected = section["rejected-recipients"];
          if (rejected.IsDefined()) {
            if (rejected.IsSequence()) {
              for (const auto &item : rejected) {
                auto address = item.IsScalar()
                                 ? util::parseAddress(item.as<std::string>())
                                 : std::nullopt;
                if (address.has_value()) {
                  payment.rejected_recipients.emplace_back(address.value());
                } else {
                  file_errors_ << "E: Value 'payment.rejected-recipients' "
                                  "contains invalid address\n";
                  file_has_error_ = true;
                }
              }
            } else {
              file_errors_ << "E: Value 'payment.rejected-recipients' "
                              "must be sequence\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'payment' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    bool fail = false;
    find_argument<std::vector<std::string>>(
        cli_values_map_,
        "reject-recipient",
        [&](const std::vector<std::string> &values) {
          for (const auto &value : values) {
            if (auto address = util::parseAddress(value); address.has_value()) {
              payment.rejected_recipients.emplace_back(address.value());
            } else {
              bad_option("reject-recipient");
              fail = true;
            }
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initApiConfig() {
    auto &api = config_->api_;

    if (config_file_.has_value()) {
      auto section = (*config_file_)["api"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto host = section["host"];
          if (host.IsDefined()) {
            if (host.IsScalar()) {
              auto value = host.as<std::string>();
              boost::beast::error_code ec;
              auto address = boost::asio::ip::make_address(value, ec);
              if (!ec) {
                api.endpoint = {address, api.endpoint.port()};
              } else {
                file_errors_ << "E: Value 'api.host' defined, "
                                "but has invalid value\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'api.host' defined, "
                              "but is not scalar\n";
              file_has_error_ = true;
            }
          }

          auto port = section["port"];
          if (port.IsDefined()) {
            if (port.IsScalar()) {
              auto value = parse_number<uint32_t>(port.as<std::string>());
              if (value.has_value() and value.value() > 0
                  and value.value() <= 65535) {
                api.endpoint = {api.endpoint.address(),
                                static_cast<uint16_t>(value.value())};
              } else {
                file_errors_ << "E: Value 'api.port' defined, "
                                "but has invalid value\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'api.port' defined, "
                              "but is not scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'api' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "api-host", [&](const std::string &value) {
          boost::beast::error_code ec;
          auto address = boost::asio::ip::make_address(value, ec);
          if (!ec) {
            api.endpoint = {address, api.endpoint.port()};
          } else {
            bad_option("api-host");
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    fail = false;
    find_argument<uint16_t>(
        cli_values_map_, "api-port", [&](const uint16_t &value) {
          if (value > 0) {
            api.endpoint = {api.endpoint.address(), value};
          } else {
            bad_option("api-port");
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initOpenMetricsConfig() {
    if (config_file_.has_value()) {
      auto section = (*config_file_)["metrics"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto enabled = section["enabled"];
          if (enabled.IsDefined()) {
            if (enabled.IsScalar()) {
              auto value = enabled.as<std::string>();
              if (value == "true") {
                config_->metrics_.enabled = true;
              } else if (value == "false") {
                config_->metrics_.enabled = false;
              } else {
                file_errors_ << "E: Value 'metrics.enabled' has wrong value. "
                                "Expected 'true' or 'false'\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'metrics.enabled' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'metrics' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    if (find_argument(cli_values_map_, "prometheus_disable")) {
      config_->metrics_.enabled = false;
    }
    if (not config_->metrics_.enabled.has_value()) {
      config_->metrics_.enabled = true;
    }

    return outcome::success();
  }

}  // namespace raffle::app
