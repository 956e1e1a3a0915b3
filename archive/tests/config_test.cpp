#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "config.h"

using pbr::archive::ArchiveConfig;
using pbr::archive::ArchiveLocation;
using pbr::archive::LoadConfig;
using pbr::archive::LocateArchive;

static void WriteFile(const std::filesystem::path& path,
                      const std::string& content) {
  std::filesystem::create_directories(path.parent_path().empty()
                                          ? std::filesystem::path(".")
                                          : path.parent_path());
  std::ofstream f(path, std::ios::binary);
  f << content;
}

int main() {
  {
    const ArchiveConfig cfg = pbr::archive::DefaultConfig();
    assert(cfg.passphrase == "no-matter-key");
    assert(cfg.decrypt.sqlcipher_binary == "sqlcipher");
    assert(cfg.decrypt.plaintext_header_size == 32);
    assert(cfg.log_level == pbr::platform::log::Level::kInfo);
    const std::string container = cfg.container_dir.string();
    assert(container.empty() ||
           container.find("6N38VWS5BX.ru.keepcoder.Telegram") !=
               std::string::npos);
  }

  {
    const std::string path = "tmp_config_full.ini";
    WriteFile(path,
              "# archive settings\n"
              "[archive]\n"
              "container_dir = /data/container  # custom\n"
              "db_path=/data/db_sqlite\n"
              "key_path = /data/.tempkeyEncrypted\n"
              "passphrase = secret#1\n"
              "\n"
              "[decrypt]\n"
              "sqlcipher = /opt/bin/sqlcipher ; engine\n"
              "temp_dir = /var/tmp\n"
              "plaintext_header_size = 64\n"
              "[log]\n"
              "level = debug\n"
              "[unknown]\n"
              "ignored = 1\n");
    ArchiveConfig cfg;
    std::string err;
    const bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.container_dir == "/data/container");
    assert(cfg.db_path == "/data/db_sqlite");
    assert(cfg.key_path == "/data/.tempkeyEncrypted");
    assert(cfg.passphrase == "secret#1");
    assert(cfg.decrypt.sqlcipher_binary == "/opt/bin/sqlcipher");
    assert(cfg.decrypt.temp_dir == "/var/tmp");
    assert(cfg.decrypt.plaintext_header_size == 64);
    assert(cfg.log_level == pbr::platform::log::Level::kDebug);
  }

  {
    const std::string path = "tmp_config_partial.ini";
    WriteFile(path, "[log]\nlevel=warn\n");
    ArchiveConfig cfg;
    std::string err;
    assert(LoadConfig(path, cfg, err));
    assert(cfg.passphrase == "no-matter-key");
    assert(cfg.decrypt.plaintext_header_size == 32);
    assert(cfg.log_level == pbr::platform::log::Level::kWarn);
  }

  {
    const char* bad[] = {
        "[decrypt]\nplaintext_header_size=0\n",
        "[decrypt]\nplaintext_header_size=2048\n",
        "[decrypt]\nplaintext_header_size=abc\n",
        "[decrypt]\nplaintext_header_size=4294967328\n",
        "[decrypt]\nplaintext_header_size=-4294967264\n",
        "[decrypt]\nplaintext_header_size=+32\n",
        "[decrypt]\nsqlcipher=\n",
        "[log]\nlevel=verbose\n",
        "[archive]\nthis line has no equals\n",
    };
    for (const char* content : bad) {
      const std::string path = "tmp_config_bad.ini";
      WriteFile(path, content);
      ArchiveConfig cfg;
      std::string err;
      assert(!LoadConfig(path, cfg, err));
      assert(!err.empty());
    }
    ArchiveConfig cfg;
    std::string err;
    assert(!LoadConfig("tmp_config_missing.ini", cfg, err));
  }

  {
    const std::filesystem::path root =
        std::filesystem::absolute("tmp_config_container");
    std::filesystem::remove_all(root);
    WriteFile(root / "appstore" / "account-9" / "postbox" / "db" / "db_sqlite",
              "db");
    WriteFile(root / ".tempkeyEncrypted", "key");

    ArchiveConfig cfg = pbr::archive::DefaultConfig();
    cfg.container_dir = root;
    ArchiveLocation loc;
    assert(LocateArchive(cfg, loc));
    assert(loc.db_path ==
           root / "appstore" / "account-9" / "postbox" / "db" / "db_sqlite");
    assert(loc.key_path == root / ".tempkeyEncrypted");

    // The appstore variant wins when both carry a key.
    WriteFile(root / "appstore" / ".tempkeyEncrypted", "key");
    assert(LocateArchive(cfg, loc));
    assert(loc.key_path == root / "appstore" / ".tempkeyEncrypted");

    // Explicit paths replace discovery.
    WriteFile(root / "manual.key", "key");
    cfg.key_path = root / "manual.key";
    assert(LocateArchive(cfg, loc));
    assert(loc.key_path == root / "manual.key");

    cfg.db_path = root / "missing.db";
    assert(!LocateArchive(cfg, loc));

    ArchiveConfig empty = pbr::archive::DefaultConfig();
    empty.container_dir = root / "nothing";
    assert(!LocateArchive(empty, loc));

    std::filesystem::remove_all(root);
  }

  return 0;
}
