#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <waypoint/authorization/authorizer.hpp>
#include <waypoint/chain/json_rpc_client.hpp>
#include <waypoint/common/error.hpp>
#include <waypoint/config/config.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/crypto/verify.hpp>
#include <waypoint/intent/builder.hpp>
#include <waypoint/intent/digest.hpp>
#include <waypoint/intent/disclosure.hpp>
#include <waypoint/net/http_client.hpp>
#include <waypoint/relay/client.hpp>
#include <waypoint/schema/json.hpp>
#include <waypoint/solver/legs.hpp>
#include <waypoint/solver/orchestrator.hpp>

#include <algorithm>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
namespace asio = boost::asio;

using task_t = std::function<asio::awaitable<int>(
    waypoint::solver::cancellation&)>;

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "cannot open " + path);
  }
  return std::string{std::istreambuf_iterator<char>{input},
                     std::istreambuf_iterator<char>{}};
}

std::string required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "--" + name + " is required");
  }
  return vm[name].as<std::string>();
}

waypoint::config::config_t load_config(const po::variables_map& vm) {
  auto config = waypoint::config::config_t{};
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto input = std::ifstream{path};
    if (!input) {
      waypoint::common::raise(waypoint::common::error_code::validation,
                              "cannot open config " + path);
    }
    config = waypoint::config::parse_config(input);
  }
  return waypoint::config::apply_overrides(std::move(config), vm);
}

void setup_logging(const waypoint::config::config_t& config) {
  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!config.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "waypoint", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(waypoint::config::parse_log_level(config.log_level));
}

// Accepts a bare array or an object with a `chainBatches` member.
const nlohmann::json& batch_list(const nlohmann::json& document) {
  if (document.is_object() && document.contains("chainBatches")) {
    return document.at("chainBatches");
  }
  return document;
}

std::vector<waypoint::schema::chain_batch_input_t> read_intent(
    const std::string& path) {
  auto document =
      waypoint::schema::decode_json<nlohmann::json>(read_file(path));
  return waypoint::schema::convert_json<
      std::vector<waypoint::schema::chain_batch_input_t>>(
      batch_list(document));
}

asio::awaitable<std::shared_ptr<waypoint::chain::json_rpc_client>>
connect_chain(const std::shared_ptr<waypoint::net::http_client>& http,
              const waypoint::config::chain_config_t& chain) {
  auto client =
      std::make_shared<waypoint::chain::json_rpc_client>(http, chain.rpc_url);
  auto reported = co_await client->chain_id();
  if (reported != chain.id) {
    waypoint::common::raise(
        waypoint::common::error_code::validation,
        "chain." + chain.name + " rpc reports chain id " +
            waypoint::schema::to_decimal(reported) + ", configured " +
            waypoint::schema::to_decimal(chain.id));
  }
  co_return client;
}

int hash_command(const po::variables_map& vm) {
  auto batches =
      waypoint::intent::hash_chain_batches(read_intent(required(vm, "intent")));
  auto digest = waypoint::intent::get_intent_hash(batches);
  auto output = nlohmann::json{
      {"chainBatches", batches},
      {"digest", waypoint::schema::to_hex_prefixed(digest)}};
  std::cout << output.dump(2) << '\n';
  return 0;
}

int disclose_command(const po::variables_map& vm) {
  auto document = waypoint::schema::decode_json<nlohmann::json>(
      read_file(required(vm, "batches")));
  auto batches =
      waypoint::schema::convert_json<waypoint::schema::chain_batches_t>(
          batch_list(document));
  auto chain_id = waypoint::schema::try_parse_uint256(required(vm, "chain-id"));
  if (!chain_id) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "--chain-id must be a non-negative integer");
  }
  auto disclosed = waypoint::intent::select_chain_for_chain_batches(
      batches, waypoint::schema::chain_selector_t{.chain_id = *chain_id});
  std::cout << nlohmann::json(disclosed).dump(2) << '\n';
  return 0;
}

asio::awaitable<int> sign_command(const po::variables_map& vm,
                                  const waypoint::config::config_t& config) {
  auto user = waypoint::config::load_signer(config.user_key, "user");
  auto batches =
      waypoint::intent::hash_chain_batches(read_intent(required(vm, "intent")));
  auto digest = waypoint::intent::get_intent_hash(batches);
  spdlog::info("user {} signing intent {}",
               waypoint::crypto::to_checksum_address(user.address()),
               waypoint::schema::to_hex_prefixed(digest));

  auto request = waypoint::schema::submit_request_t{};
  auto signature = user.sign_intent(digest);
  request.intent_authorization.signature =
      waypoint::schema::bytes_t{std::begin(signature), std::end(signature)};
  request.intent_authorization.chain_batches = batches;

  auto http = std::shared_ptr<waypoint::net::http_client>{
      std::make_shared<waypoint::net::beast_http_client>()};
  for (const auto& chain_id : waypoint::intent::distinct_chains(batches)) {
    const auto& chain = waypoint::config::find_chain(config, chain_id);
    auto client = co_await connect_chain(http, chain);
    auto authorizer = waypoint::authorization::authorizer{chain.delegate};
    request.authorization.push_back(
        co_await authorizer.authorize_user(*client, user));
  }

  auto output = waypoint::schema::encode_json(request, 2);
  if (vm.contains("out")) {
    auto out = std::ofstream{vm["out"].as<std::string>()};
    out << output << '\n';
    if (!out) {
      waypoint::common::raise(waypoint::common::error_code::validation,
                              "failed to write " + vm["out"].as<std::string>());
    }
  } else {
    std::cout << output << '\n';
  }
  co_return 0;
}

asio::awaitable<int> execute_command(const po::variables_map& vm,
                                     const waypoint::config::config_t& config,
                                     waypoint::solver::cancellation& cancel) {
  auto signed_intent =
      waypoint::schema::decode_json<waypoint::schema::submit_request_t>(
          read_file(required(vm, "signed")));
  const auto& intent = signed_intent.intent_authorization;
  auto digest = waypoint::intent::get_intent_hash(intent.chain_batches);
  auto user = waypoint::crypto::recover_message_signer(
      waypoint::schema::bytes_view_t{digest},
      waypoint::schema::make_bytes_view(intent.signature));
  if (!user) {
    waypoint::common::raise(waypoint::common::error_code::signature,
                            "intent signature does not recover");
  }
  auto solver = waypoint::config::load_signer(config.solver_key, "solver");
  spdlog::info("solver {} executing intent {} for {}",
               waypoint::crypto::to_checksum_address(solver.address()),
               waypoint::schema::to_hex_prefixed(digest),
               waypoint::crypto::to_checksum_address(*user));

  auto http = std::shared_ptr<waypoint::net::http_client>{
      std::make_shared<waypoint::net::beast_http_client>()};
  auto legs = std::vector<waypoint::solver::leg_t>{};
  for (const auto& chain_id :
       waypoint::intent::distinct_chains(intent.chain_batches)) {
    const auto& chain = waypoint::config::find_chain(config, chain_id);
    const auto& authorization = waypoint::solver::find_user_authorization(
        signed_intent.authorization, chain_id);
    auto client = co_await connect_chain(http, chain);
    legs.push_back(
        waypoint::solver::make_leg(std::move(client), chain, *user,
                                   authorization));
  }

  auto orchestrator = waypoint::solver::orchestrator{
      solver, *user,
      waypoint::solver::orchestrator_options_t{
          .watermark = {.poll_interval = config.poll_interval,
                        .timeout = config.watermark_timeout},
          .receipt_poll_interval = config.receipt_poll_interval}};
  auto results = co_await orchestrator.execute_intent(intent, legs, &cancel);

  auto output = nlohmann::json::array();
  auto failed = false;
  for (const auto& result : results) {
    auto entry = nlohmann::json{
        {"chainId", waypoint::schema::to_decimal(result.chain_id)},
        {"status", std::string{waypoint::schema::to_string(result.status)}}};
    if (result.transaction_hash) {
      entry["transactionHash"] =
          waypoint::schema::to_hex_prefixed(*result.transaction_hash);
    }
    if (result.error) {
      entry["error"] =
          std::string{waypoint::common::to_string(*result.error)};
    }
    if (!result.message.empty()) {
      entry["message"] = result.message;
    }
    failed = failed ||
             result.status != waypoint::schema::leg_status_t::confirmed;
    output.push_back(std::move(entry));
  }
  std::cout << output.dump(2) << '\n';
  co_return failed ? 2 : 0;
}

asio::awaitable<int> submit_command(const po::variables_map& vm,
                                    const waypoint::config::config_t& config) {
  auto request =
      waypoint::schema::decode_json<waypoint::schema::submit_request_t>(
          read_file(required(vm, "signed")));
  if (config.relay_url.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "relay.url is not configured");
  }
  auto relay = waypoint::relay::client{
      std::make_shared<waypoint::net::beast_http_client>(), config.relay_url};
  auto response = co_await relay.submit_transaction(request);
  std::cout << waypoint::schema::encode_json(response, 2) << '\n';
  co_return 0;
}

int run(const task_t& task) {
  auto io = asio::io_context{};
  auto cancel = waypoint::solver::cancellation{};
  auto signals = asio::signal_set{io, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int signal) {
    if (!ec) {
      spdlog::warn("signal {} received, cancelling", signal);
      cancel.cancel();
    }
  });

  auto exit_code = 1;
  auto failure = std::exception_ptr{};
  asio::co_spawn(io, task(cancel), [&](std::exception_ptr error, int code) {
    failure = error;
    exit_code = code;
    signals.cancel();
  });
  io.run();
  if (failure) {
    std::rethrow_exception(failure);
  }
  return exit_code;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  waypoint hash --intent FILE\n"
            << "  waypoint disclose --batches FILE --chain-id N\n"
            << "  waypoint sign --intent FILE --config FILE [--out FILE]\n"
            << "  waypoint execute --signed FILE --config FILE\n"
            << "  waypoint submit --signed FILE --config FILE\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"waypoint options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "hash|disclose|sign|execute|submit")(
      "config,c", po::value<std::string>(), "INI configuration file")(
      "intent", po::value<std::string>(), "chain batch inputs (JSON)")(
      "batches", po::value<std::string>(), "hashed chain batches (JSON)")(
      "signed", po::value<std::string>(), "signed intent package (JSON)")(
      "chain-id", po::value<std::string>(), "chain to disclose")(
      "out,o", po::value<std::string>(), "write the signed package here");
  options.add(waypoint::config::make_options_description());

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto exit_code = 1;
  try {
    auto config = load_config(vm);
    setup_logging(config);

    if (command == "hash") {
      exit_code = hash_command(vm);
    } else if (command == "disclose") {
      exit_code = disclose_command(vm);
    } else if (command == "sign") {
      exit_code = run([&](waypoint::solver::cancellation&) {
        return sign_command(vm, config);
      });
    } else if (command == "execute") {
      exit_code = run([&](waypoint::solver::cancellation& cancel) {
        return execute_command(vm, config, cancel);
      });
    } else if (command == "submit") {
      exit_code = run([&](waypoint::solver::cancellation&) {
        return submit_command(vm, config);
      });
    } else {
      spdlog::error("command must be hash|disclose|sign|execute|submit");
    }
  } catch (const waypoint::common::error& e) {
    spdlog::error("[{}] {}", waypoint::common::to_string(e.code()), e.what());
    if (!e.detail().empty()) {
      spdlog::error("{}", e.detail());
    }
    exit_code = 1;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
