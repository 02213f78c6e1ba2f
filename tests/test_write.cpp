#include <catch2/catch.hpp>
#include <fsgate/fsgate.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace fsgate;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("fsgate_wtest_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return fs::canonical(tmp);
}

static std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static size_t count_entries(const fs::path& dir) {
    size_t n = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) ++n;
    return n;
}

// ---------------------------------------------------------------------------
// write_file
// ---------------------------------------------------------------------------

TEST_CASE("write: round trip with multi-byte content", "[write]") {
    auto dir = make_temp_dir();
    Sandbox box;
    box.replace_roots({dir.string()});

    std::string content = "h\xC3\xA9llo w\xC3\xB6rld \xE2\x9C\x93\n\xF0\x9F\x98\x80\n";
    auto path = (dir / "a.txt").string();
    box.write_file(path, content);
    CHECK(box.read_text(path) == content);
    CHECK(slurp(path) == content);
    fs::remove_all(dir);
}

TEST_CASE("write: overwrite leaves no temporary files", "[write]") {
    auto dir = make_temp_dir();
    FileMutationEngine engine;
    auto path = (dir / "a.txt").string();

    engine.write_file(path, "one");
    engine.write_file(path, "two");
    CHECK(slurp(path) == "two");
    CHECK(count_entries(dir) == 1);
    fs::remove_all(dir);
}

TEST_CASE("write: existing permission bits are kept", "[write]") {
    auto dir = make_temp_dir();
    FileMutationEngine engine;
    auto path = dir / "script.sh";
    engine.write_file(path.string(), "#!/bin/sh\n");
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read);

    engine.write_file(path.string(), "#!/bin/sh\necho hi\n");
    auto perms = fs::status(path).permissions();
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
    CHECK((perms & fs::perms::others_read) == fs::perms::none);
    fs::remove_all(dir);
}

TEST_CASE("write: missing parent is NotFoundError", "[write]") {
    auto dir = make_temp_dir();
    FileMutationEngine engine;
    CHECK_THROWS_AS(engine.write_file((dir / "no" / "a.txt").string(), "x"), NotFoundError);
    fs::remove_all(dir);
}

TEST_CASE("write: onto a directory is IsADirectoryError", "[write]") {
    auto dir = make_temp_dir();
    fs::create_directories(dir / "sub");
    FileMutationEngine engine;
    CHECK_THROWS_AS(engine.write_file((dir / "sub").string(), "x"), IsADirectoryError);
    CHECK(fs::is_directory(dir / "sub"));
    CHECK(count_entries(dir) == 1);
    fs::remove_all(dir);
}

TEST_CASE("write: outside roots is denied", "[write]") {
    auto dir = make_temp_dir();
    fs::create_directories(dir / "root");
    Sandbox box;
    box.replace_roots({(dir / "root").string()});

    CHECK_THROWS_AS(box.write_file((dir / "evil.txt").string(), "x"), AccessDeniedError);
    CHECK_FALSE(fs::exists(dir / "evil.txt"));
    fs::remove_all(dir);
}

TEST_CASE("write: concurrent writers never interleave", "[write]") {
    auto dir = make_temp_dir();
    FileMutationEngine engine;
    auto path = (dir / "shared.txt").string();

    const std::string a(256 * 1024, 'a');
    const std::string b(256 * 1024, 'b');
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            for (int round = 0; round < 5; ++round) {
                engine.write_file(path, (i % 2 == 0) ? a : b);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::string final_content = slurp(path);
    CHECK((final_content == a || final_content == b));
    CHECK(count_entries(dir) == 1);
    fs::remove_all(dir);
}

TEST_CASE("write: concurrent new files honour the umask", "[write]") {
    auto dir = make_temp_dir();
    FileMutationEngine engine;
    mode_t old_mask = ::umask(022);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            for (int n = 0; n < 200; ++n) {
                auto name = "f" + std::to_string(i) + "_" + std::to_string(n) + ".txt";
                engine.write_file((dir / name).string(), "x");
            }
        });
    }
    for (auto& t : threads) t.join();
    ::umask(old_mask);

    size_t files = 0, writable = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        ++files;
        auto perms = entry.status().permissions();
        if ((perms & (fs::perms::group_write | fs::perms::others_write)) != fs::perms::none) {
            ++writable;
        }
        CHECK((perms & fs::perms::owner_read) != fs::perms::none);
    }
    CHECK(files == 1600);
    CHECK(writable == 0);
    fs::remove_all(dir);
}

TEST_CASE("write: long file names still publish atomically", "[write]") {
    auto dir = make_temp_dir();
    Sandbox box;
    box.replace_roots({dir.string()});

    std::string name(240, 'n');
    auto path = (dir / name).string();
    box.write_file(path, "first");
    box.write_file(path, "second");
    CHECK(slurp(path) == "second");
    CHECK(count_entries(dir) == 1);
    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// create_directory
// ---------------------------------------------------------------------------

TEST_CASE("mkdir: creates parents and tolerates existing", "[write]") {
    auto dir = make_temp_dir();
    Sandbox box;
    box.replace_roots({dir.string()});

    auto deep = (dir / "a" / "b" / "c").string();
    box.create_directory(deep);
    CHECK(fs::is_directory(deep));
    box.create_directory(deep);
    CHECK(fs::is_directory(deep));
    fs::remove_all(dir);
}

TEST_CASE("mkdir: file in the way is NotADirectoryError", "[write]") {
    auto dir = make_temp_dir();
    std::ofstream(dir / "f") << "x";
    FileMutationEngine engine;
    CHECK_THROWS_AS(engine.create_directory((dir / "f").string()), NotADirectoryError);
    CHECK_THROWS_AS(engine.create_directory((dir / "f" / "sub").string()), NotADirectoryError);
    fs::remove_all(dir);
}
