#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chat_store.h"
#include "config.h"
#include "platform_log.h"

namespace {

struct Options {
  std::string config_path;
  std::filesystem::path plaintext;
  bool stats{false};
  std::optional<std::size_t> recent;
  std::string find;
  std::string resolve;
  std::optional<std::int64_t> read_peer;
  std::string search;
  std::optional<std::int32_t> export_since;
  std::size_t limit{20};
  bool show_help{false};
};

void PrintUsage() {
  std::cout
      << "Usage: pbr_archive_probe [--config PATH] [--plaintext PATH] "
         "COMMAND...\n"
         "  --config PATH      INI file with [archive], [decrypt] and [log]\n"
         "  --plaintext PATH   Use an already decrypted database\n"
         "  --limit N          Result limit for --read and --search "
         "(default: 20)\n"
         "  --stats            Print message and peer counts\n"
         "  --recent N         List the N most recent chats\n"
         "  --find TEXT        Find chats by name, username or phone\n"
         "  --resolve TEXT     Resolve a name, phone or id to a peer id\n"
         "  --read ID          Read the newest messages of a chat\n"
         "  --search TEXT      Search message text\n"
         "  --export SINCE     Dump messages with timestamp >= SINCE\n";
}

bool ParseCount(const std::string& text, std::uint64_t& out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  out = std::strtoull(text.c_str(), nullptr, 10);
  return true;
}

bool ParseSigned(const std::string& text, std::int64_t& out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  out = static_cast<std::int64_t>(value);
  return true;
}

bool ParseArgs(int argc, char** argv, Options& out, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      out.show_help = true;
      return true;
    }
    if (arg == "--stats") {
      out.stats = true;
      continue;
    }
    if (i + 1 >= argc) {
      error = arg + " requires a value";
      return false;
    }
    const std::string value = argv[++i];
    std::uint64_t count = 0;
    std::int64_t number = 0;
    if (arg == "--config") {
      out.config_path = value;
    } else if (arg == "--plaintext") {
      out.plaintext = value;
    } else if (arg == "--limit") {
      if (!ParseCount(value, count)) {
        error = "invalid --limit";
        return false;
      }
      out.limit = static_cast<std::size_t>(count);
    } else if (arg == "--recent") {
      if (!ParseCount(value, count)) {
        error = "invalid --recent";
        return false;
      }
      out.recent = static_cast<std::size_t>(count);
    } else if (arg == "--find") {
      out.find = value;
    } else if (arg == "--resolve") {
      out.resolve = value;
    } else if (arg == "--read") {
      if (!ParseSigned(value, number)) {
        error = "invalid --read";
        return false;
      }
      out.read_peer = number;
    } else if (arg == "--search") {
      out.search = value;
    } else if (arg == "--export") {
      if (!ParseSigned(value, number)) {
        error = "invalid --export";
        return false;
      }
      out.export_since = static_cast<std::int32_t>(number);
    } else {
      error = "unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

std::string FormatTime(std::int32_t timestamp) {
  const std::time_t t = static_cast<std::time_t>(timestamp);
  std::tm local{};
  if (localtime_r(&t, &local) == nullptr) {
    return std::to_string(timestamp);
  }
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0) {
    return std::to_string(timestamp);
  }
  return buf;
}

bool Report(pbr::archive::ArchiveStatus status, const std::string& error) {
  if (status == pbr::archive::ArchiveStatus::kOk) {
    return true;
  }
  std::cerr << "[pbr_archive_probe] "
            << pbr::archive::ArchiveStatusName(status) << ": " << error
            << "\n";
  return false;
}

int Run(const Options& opt, pbr::archive::ChatStore& store) {
  using pbr::archive::ArchiveStatus;
  std::string error;

  if (!opt.plaintext.empty()) {
    if (!Report(store.OpenPlaintext(opt.plaintext, error), error)) {
      return 1;
    }
  } else if (!store.Available()) {
    std::cerr << "[pbr_archive_probe] archive not found\n";
    return 2;
  }

  if (opt.stats) {
    pbr::archive::Stats stats;
    if (!Report(store.GetStats(stats, error), error)) {
      return 1;
    }
    std::cout << "messages " << stats.messages << "\npeers " << stats.peers
              << "\n";
  }
  if (opt.recent) {
    std::vector<pbr::archive::ChatSummary> chats;
    if (!Report(store.RecentChats(*opt.recent, chats, error), error)) {
      return 1;
    }
    for (const auto& chat : chats) {
      std::cout << chat.peer_id << "\t" << FormatTime(chat.last_message_timestamp)
                << "\t" << chat.name << "\n";
    }
  }
  if (!opt.find.empty()) {
    std::vector<pbr::archive::ChatSummary> chats;
    if (!Report(store.FindChats(opt.find, chats, error), error)) {
      return 1;
    }
    for (const auto& chat : chats) {
      std::cout << chat.peer_id << "\t" << chat.name << "\t" << chat.username
                << "\t" << chat.phone << "\n";
    }
  }
  if (!opt.resolve.empty()) {
    std::optional<std::int64_t> peer_id;
    if (!Report(store.ResolveIdentifier(opt.resolve, peer_id, error),
                error)) {
      return 1;
    }
    if (!peer_id) {
      std::cerr << "[pbr_archive_probe] no match for " << opt.resolve << "\n";
      return 3;
    }
    std::cout << *peer_id << "\n";
  }
  if (opt.read_peer) {
    std::vector<pbr::archive::MessageRecord> messages;
    if (!Report(store.ReadMessages(*opt.read_peer, opt.limit, messages, error),
                error)) {
      return 1;
    }
    for (const auto& msg : messages) {
      std::cout << FormatTime(msg.timestamp) << "\t" << msg.sender << "\t"
                << msg.text << "\n";
    }
  }
  if (!opt.search.empty()) {
    std::vector<pbr::archive::SearchHit> hits;
    if (!Report(store.SearchMessages(opt.search, opt.limit, hits, error),
                error)) {
      return 1;
    }
    for (const auto& hit : hits) {
      std::cout << FormatTime(hit.timestamp) << "\t" << hit.chat_name << "\t"
                << hit.sender << "\t" << hit.text << "\n";
    }
  }
  if (opt.export_since) {
    std::vector<pbr::archive::ArchiveMessage> messages;
    if (!Report(store.ExportMessages(*opt.export_since, messages, error),
                error)) {
      return 1;
    }
    for (const auto& msg : messages) {
      std::cout << msg.peer_id << "\t" << msg.message_id << "\t"
                << msg.timestamp << "\t"
                << (msg.is_from_me ? "me" : msg.sender_name.value_or(""))
                << "\t" << msg.text << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  std::string error;
  if (!ParseArgs(argc, argv, opt, error)) {
    std::cerr << "[pbr_archive_probe] " << error << "\n";
    PrintUsage();
    return 1;
  }
  if (opt.show_help) {
    PrintUsage();
    return 0;
  }

  pbr::archive::ArchiveConfig config = pbr::archive::DefaultConfig();
  if (!opt.config_path.empty() &&
      !pbr::archive::LoadConfig(opt.config_path, config, error)) {
    std::cerr << "[pbr_archive_probe] " << error << "\n";
    return 1;
  }
  pbr::platform::log::SetMinLevel(config.log_level);

  pbr::archive::ChatStore store(config);
  const int rc = Run(opt, store);
  store.Close();
  return rc;
}
