#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "platform_fs.h"
#include "platform_log.h"
#include "platform_process.h"
#include "platform_random.h"

namespace plog = pbr::platform::log;

namespace {

struct Captured {
  int count{0};
  plog::Level level{plog::Level::kDebug};
  std::string tag;
  std::string message;
  std::vector<std::string> fields;
};

void Capture(plog::Level level, const char* tag, const char* message,
             const plog::Field* fields, std::size_t field_count,
             void* user_data) {
  auto* out = static_cast<Captured*>(user_data);
  ++out->count;
  out->level = level;
  out->tag = tag;
  out->message = message;
  out->fields.clear();
  for (std::size_t i = 0; i < field_count; ++i) {
    out->fields.push_back(std::string(fields[i].key) + "=" +
                          std::string(fields[i].value));
  }
}

}  // namespace

int main() {
  {
    Captured cap;
    plog::SetLogCallback(&Capture, &cap);
    plog::SetMinLevel(plog::Level::kInfo);
    plog::Log(plog::Level::kDebug, "t", "hidden");
    assert(cap.count == 0);
    plog::Log(plog::Level::kWarn, "decrypt", "failed passphrase=hunter2",
             {{"key", "abcd"}, {"key_path", "/tmp/k"}, {"bytes", "10"}});
    assert(cap.count == 1);
    assert(cap.level == plog::Level::kWarn);
    assert(cap.tag == "decrypt");
    assert(cap.message == "failed passphrase=***");
    assert(cap.fields.size() == 3);
    assert(cap.fields[0] == "key=***");
    assert(cap.fields[1] == "key_path=/tmp/k");
    assert(cap.fields[2] == "bytes=10");
    plog::SetLogCallback(nullptr, nullptr);

    plog::Level parsed = plog::Level::kInfo;
    assert(plog::ParseLevel("DEBUG", parsed) && parsed == plog::Level::kDebug);
    assert(plog::ParseLevel("warn", parsed) && parsed == plog::Level::kWarn);
    assert(!plog::ParseLevel("loud", parsed));
    assert(std::string(plog::LevelName(plog::Level::kError)) == "ERROR");
    assert(plog::IsSensitiveKey("db_secret"));
    assert(!plog::IsSensitiveKey("db_path"));
  }

  {
    pbr::platform::ProcessResult result;
    std::error_code ec;
    const std::vector<std::string> argv = {
        "/bin/sh", "-c", "cat; echo oops >&2; exit 3"};
    assert(pbr::platform::RunProcess(argv, "ping\n", result, ec));
    assert(result.exit_code == 3);
    assert(!result.signaled);
    assert(result.stdout_data == "ping\n");
    assert(result.stderr_data == "oops\n");

    // The child ignoring its input must not break the writer.
    const std::string big(1 << 20, 'x');
    const std::vector<std::string> quiet = {"/bin/sh", "-c", "exit 0"};
    assert(pbr::platform::RunProcess(quiet, big, result, ec));
    assert(result.exit_code == 0);

    const std::vector<std::string> missing = {"./tmp_no_such_binary"};
    assert(!pbr::platform::RunProcess(missing, "", result, ec));
    assert(ec);
  }

  {
    namespace fs = pbr::platform::fs;
    const std::filesystem::path dir = "tmp_platform_dir";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    {
      std::ofstream(dir / "b.bin", std::ios::binary) << "xyz";
      std::ofstream(dir / "a.bin", std::ios::binary) << "";
    }
    std::error_code ec;
    std::vector<std::filesystem::path> entries;
    assert(fs::ListDir(dir, entries, ec));
    assert(entries.size() == 2);
    assert(entries[0].filename() == "a.bin");
    assert(fs::IsDirectory(dir, ec));
    assert(fs::IsRegularFile(dir / "b.bin", ec));
    assert(fs::FileSize(dir / "b.bin", ec) == 3);
    std::vector<std::uint8_t> bytes;
    assert(fs::ReadFileBytes(dir / "b.bin", bytes, ec));
    assert(bytes.size() == 3 && bytes[0] == 'x');
    assert(!fs::ReadFileBytes(dir / "none.bin", bytes, ec));
    assert(fs::Remove(dir / "b.bin", ec));
    assert(!fs::Exists(dir / "b.bin", ec));
    assert(!fs::TempDirectory(ec).empty());
    std::filesystem::remove_all(dir);
  }

  {
    std::vector<std::uint8_t> a(32, 0);
    std::vector<std::uint8_t> b(32, 0);
    assert(pbr::platform::RandomBytes(a.data(), a.size()));
    assert(pbr::platform::RandomBytes(b.data(), b.size()));
    assert(a != b);
  }

  return 0;
}
