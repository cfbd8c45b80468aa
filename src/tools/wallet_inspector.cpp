#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/key/wallet_keys.hpp>
#include <quorum/schema/encoding/scale/wallet_event_record.hpp>
#include <quorum/schema/wallet_error.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <quorum/wallet/engine.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;
using storage_t =
    quorum::storage::storage<quorum::storage::rocksdb_storage_tag>;
namespace po = boost::program_options;

std::string describe_event(const quorum::schema::wallet_event_t& event) {
  using namespace quorum::schema;
  return std::visit(
      overloaded{
          [](const owner_added_t& e) { return to_hex(e.owner); },
          [](const deposit_t& e) {
            return fmt::format("sender={} amount={}", to_hex(e.sender),
                               e.amount.str());
          },
          [](const proposed_transaction_t& e) {
            return fmt::format("id={} proposer={} recipient={} value={}",
                               e.transaction_id, to_hex(e.proposer),
                               to_hex(e.recipient), e.value.str());
          },
          [](const approved_transaction_t& e) {
            return fmt::format("id={} approver={}", e.transaction_id,
                               to_hex(e.approver));
          },
          [](const already_approved_transaction_t& e) {
            return fmt::format("id={} approver={}", e.transaction_id,
                               to_hex(e.approver));
          },
          [](const transaction_executed_t& e) {
            return fmt::format("id={} executor={}", e.transaction_id,
                               to_hex(e.executor));
          }},
      event);
}

/// Configuration given on the command line, or the one already persisted.
std::optional<quorum::schema::wallet_config_t> resolve_config(
    encoder_t& encoder,
    storage_t& storage,
    const std::vector<std::string>& owners,
    const uint32_t required_approvals) {
  if (owners.empty()) {
    auto key = quorum::schema::key::make_config_key(encoder);
    return storage.get<quorum::schema::wallet_config_t>(
        encoder, quorum::schema::make_bytes_view(key));
  }

  auto config = quorum::schema::wallet_config_t{};
  config.required_approvals = required_approvals;
  for (const auto& owner : owners) {
    auto address = quorum::schema::try_make_address(owner);
    if (!address) {
      spdlog::error("'{}' is not a 20 byte hex address", owner);
      return std::nullopt;
    }
    config.owners.push_back(*address);
  }
  return config;
}

/// Walk the persisted event journal directly, keyed by the id in each row.
void print_journal(encoder_t& encoder,
                   const storage_t& storage,
                   const uint64_t events_from,
                   const uint64_t events_to) {
  auto prefix = quorum::schema::key::make_prefix_key(
      encoder, quorum::schema::key::kEventPrefix);
  auto rows =
      storage.list_by_prefix(quorum::schema::make_bytes_view(prefix));

  auto journal = std::vector<quorum::schema::wallet_event_record_t>{};
  for (const auto& [key, value] : rows) {
    auto event_id = quorum::schema::key::parse_event_key(
        encoder, quorum::schema::make_bytes_view(key));
    if (!event_id) {
      spdlog::warn("Skipping malformed journal key {}",
                   quorum::schema::to_hex(quorum::schema::make_bytes_view(key)));
      continue;
    }
    if (*event_id < events_from || *event_id > events_to) {
      continue;
    }
    auto record =
        encoder.try_decode<quorum::schema::wallet_event_record_t>(
            quorum::schema::make_bytes_view(value));
    if (!record || record->event_id != *event_id) {
      spdlog::warn("Journal row {} does not decode to its own event", *event_id);
      continue;
    }
    journal.push_back(std::move(*record));
  }
  // Little-endian ids do not sort numerically as raw keys.
  std::ranges::sort(journal, {},
                    &quorum::schema::wallet_event_record_t::event_id);

  std::cout << "events (" << journal.size() << "):\n";
  for (const auto& record : journal) {
    std::cout << fmt::format(
        "  {} {} {}\n", record.event_id,
        quorum::schema::to_string(quorum::schema::event_type(record.event)),
        describe_event(record.event));
  }
}

void print_wallet(const quorum::wallet::engine& wallet) {
  using quorum::schema::to_hex;

  auto owners = wallet.owners();
  std::cout << "owners (" << owners.size() << "):\n";
  for (const auto& owner : owners) {
    std::cout << "  " << to_hex(owner) << "\n";
  }
  std::cout << "required approvals: " << wallet.required_approvals() << "\n";

  auto count = wallet.transaction_count();
  std::cout << "transactions (" << count << "):\n";
  for (auto id = uint64_t{0}; id < count; ++id) {
    auto state = wallet.transaction(id);
    if (!state) {
      continue;
    }
    std::cout << fmt::format("  #{} to {} value {} approvals {}/{}{}\n", id,
                             to_hex(state->recipient), state->value.str(),
                             state->approval_count,
                             wallet.required_approvals(),
                             state->executed ? " executed" : "");
    for (const auto& owner : owners) {
      if (wallet.has_approved(id, owner)) {
        std::cout << "    approved by " << to_hex(owner) << "\n";
      }
    }
  }

  auto root = wallet.state_root();
  std::cout << "state root: "
            << quorum::schema::to_hex(
                   quorum::schema::bytes_view_t{root.data(), root.size()})
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto owners = std::vector<std::string>{};
  auto required_approvals = uint32_t{1};
  auto events_from = uint64_t{0};
  auto events_to = std::numeric_limits<uint64_t>::max();

  auto vm = po::variables_map{};
  auto description = po::options_description{"Quorum wallet inspector"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&db_path)->required(),
      "RocksDB directory holding the wallet")(
      "owner,o", po::value<std::vector<std::string>>(&owners)->composing(),
      "Owner address; repeat to provision or verify the wallet")(
      "required-approvals,r",
      po::value<uint32_t>(&required_approvals)->default_value(1),
      "Approvals needed before a transaction executes")(
      "events-from", po::value<uint64_t>(&events_from)->default_value(0),
      "First event id to print")(
      "events-to", po::value<uint64_t>(&events_to),
      "Last event id to print")(
      "log-file,l",
      po::value<std::string>(&log_file)->default_value("quorum_inspector.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "inspector", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto encoder = encoder_t{};
  auto storage =
      quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(
          db_path);
  auto config = resolve_config(encoder, storage, owners, required_approvals);
  if (!config) {
    if (owners.empty()) {
      spdlog::error("No wallet at {}; pass --owner to provision one", db_path);
    }
    spdlog::shutdown();
    return 1;
  }

  auto exit_code = 0;
  try {
    auto pool =
        quorum::wallet::value_pool<quorum::wallet::in_memory_pool_tag>{};
    auto wallet = quorum::wallet::engine{encoder, storage, pool, *config};
    print_wallet(wallet);
    print_journal(encoder, storage, events_from, events_to);
  } catch (const quorum::schema::wallet_exception& ex) {
    spdlog::error("Cannot open wallet at {}: {}", db_path, ex.what());
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
