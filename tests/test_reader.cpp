#include <catch2/catch.hpp>
#include <fsgate/fsgate.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <chrono>

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace fsgate;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("fsgate_rdtest_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return fs::canonical(tmp);
}

static void write(const fs::path& p, const std::string& content) {
    std::ofstream(p, std::ios::binary) << content;
}

static ReadOptions head(size_t n) {
    ReadOptions o;
    o.head = n;
    return o;
}

static ReadOptions tail(size_t n) {
    ReadOptions o;
    o.tail = n;
    return o;
}

// ---------------------------------------------------------------------------
// read_text
// ---------------------------------------------------------------------------

TEST_CASE("reader: whole file is returned byte for byte", "[reader]") {
    auto dir = make_temp_dir();
    write(dir / "a.txt", "one\r\ntwo\n");
    FileReader reader;
    CHECK(reader.read_text((dir / "a.txt").string()) == "one\r\ntwo\n");
    fs::remove_all(dir);
}

TEST_CASE("reader: head returns the first lines", "[reader]") {
    auto dir = make_temp_dir();
    write(dir / "a.txt", "1\n2\n3\n4\n");
    write(dir / "crlf.txt", "a\r\nb\r\nc\r\n");
    FileReader reader;

    CHECK(reader.read_text((dir / "a.txt").string(), head(2)) == "1\n2");
    CHECK(reader.read_text((dir / "a.txt").string(), head(10)) == "1\n2\n3\n4");
    CHECK(reader.read_text((dir / "a.txt").string(), head(0)) == "");
    CHECK(reader.read_text((dir / "crlf.txt").string(), head(2)) == "a\nb");
    fs::remove_all(dir);
}

TEST_CASE("reader: tail returns the last lines", "[reader]") {
    auto dir = make_temp_dir();
    write(dir / "a.txt", "1\n2\n3\n4\n");
    write(dir / "nofinal.txt", "1\n2\n3");
    write(dir / "crlf.txt", "a\r\nb\r\nc\r\n");
    FileReader reader;

    CHECK(reader.read_text((dir / "a.txt").string(), tail(2)) == "3\n4");
    CHECK(reader.read_text((dir / "a.txt").string(), tail(10)) == "1\n2\n3\n4");
    CHECK(reader.read_text((dir / "nofinal.txt").string(), tail(1)) == "3");
    CHECK(reader.read_text((dir / "crlf.txt").string(), tail(2)) == "b\nc");
    fs::remove_all(dir);
}

TEST_CASE("reader: tail across chunk boundaries", "[reader]") {
    auto dir = make_temp_dir();
    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += "line number " + std::to_string(i) + "\r\n";
    }
    write(dir / "big.txt", content);
    FileReader reader;

    std::string expected;
    for (int i = 440; i < 500; ++i) {
        if (!expected.empty()) expected += "\n";
        expected += "line number " + std::to_string(i);
    }
    CHECK(reader.read_text((dir / "big.txt").string(), tail(60)) == expected);
    CHECK(reader.read_text((dir / "big.txt").string(), head(1)) == "line number 0");
    fs::remove_all(dir);
}

TEST_CASE("reader: head and tail together are rejected", "[reader]") {
    auto dir = make_temp_dir();
    write(dir / "a.txt", "x\n");
    ReadOptions both;
    both.head = 1;
    both.tail = 1;
    FileReader reader;
    CHECK_THROWS_AS(reader.read_text((dir / "a.txt").string(), both), std::invalid_argument);
    fs::remove_all(dir);
}

TEST_CASE("reader: directories and missing files", "[reader]") {
    auto dir = make_temp_dir();
    FileReader reader;
    CHECK_THROWS_AS(reader.read_text(dir.string()), IsADirectoryError);
    CHECK_THROWS_AS(reader.read_text((dir / "missing").string()), NotFoundError);
    CHECK_THROWS_AS(reader.read_text((dir / "missing").string(), tail(1)), NotFoundError);
    fs::remove_all(dir);
}

TEST_CASE("reader: FIFOs are rejected without blocking", "[reader]") {
    auto dir = make_temp_dir();
    auto pipe = (dir / "pipe").string();
    REQUIRE(::mkfifo(pipe.c_str(), 0644) == 0);

    FileReader reader;
    CHECK_THROWS_AS(reader.read_text(pipe), IoError);
    CHECK_THROWS_AS(reader.read_text(pipe, head(1)), IoError);
    CHECK_THROWS_AS(reader.read_text(pipe, tail(1)), IoError);
    CHECK_THROWS_AS(reader.read_media(pipe), IoError);

    Sandbox box;
    box.replace_roots({dir.string()});
    CHECK_THROWS_AS(box.read_text(pipe), IoError);
    CHECK_THROWS_AS(box.edit_file(pipe, {{"a", "b"}}, true), IoError);
    CHECK(fs::is_fifo(pipe));
    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// read_media
// ---------------------------------------------------------------------------

TEST_CASE("reader: media is base64 with a MIME type", "[reader]") {
    auto dir = make_temp_dir();
    write(dir / "pic.PNG", std::string("\x89PNG", 4));
    write(dir / "blob.bin", "Man");
    FileReader reader;

    auto png = reader.read_media((dir / "pic.PNG").string());
    CHECK(png.mime_type == "image/png");
    CHECK(png.data == "iVBORw==");
    CHECK(png.is_image());

    auto bin = reader.read_media((dir / "blob.bin").string());
    CHECK(bin.mime_type == "application/octet-stream");
    CHECK(bin.data == "TWFu");
    CHECK_FALSE(bin.is_image());
    CHECK_FALSE(bin.is_audio());
    fs::remove_all(dir);
}

TEST_CASE("reader: MIME types by extension", "[reader]") {
    CHECK(mime_type_for("a.jpg") == "image/jpeg");
    CHECK(mime_type_for("a.JPEG") == "image/jpeg");
    CHECK(mime_type_for("x/y.svg") == "image/svg+xml");
    CHECK(mime_type_for("song.mp3") == "audio/mpeg");
    CHECK(mime_type_for("a.flac") == "audio/flac");
    CHECK(mime_type_for("noext") == "application/octet-stream");
    CHECK(mime_type_for("dir.png/file") == "application/octet-stream");
}

// ---------------------------------------------------------------------------
// info / format_size
// ---------------------------------------------------------------------------

TEST_CASE("reader: info reports type, size and permissions", "[reader]") {
    auto dir = make_temp_dir();
    write(dir / "a.txt", "12345");
    fs::permissions(dir / "a.txt", fs::perms::owner_read | fs::perms::owner_write |
                                   fs::perms::group_read);
    FileReader reader;

    auto fi = reader.info((dir / "a.txt").string());
    CHECK(fi.size == 5);
    CHECK(fi.is_file);
    CHECK_FALSE(fi.is_directory);
    CHECK_FALSE(fi.is_symlink);
    CHECK(fi.permissions == "640");
    CHECK(fi.modified > 0);

    auto di = reader.info(dir.string());
    CHECK(di.is_directory);
    CHECK_FALSE(di.is_file);

    CHECK_THROWS_AS(reader.info((dir / "missing").string()), NotFoundError);
    fs::remove_all(dir);
}

TEST_CASE("reader: format_size", "[reader]") {
    CHECK(format_size(0) == "0 B");
    CHECK(format_size(512) == "512 B");
    CHECK(format_size(1023) == "1023 B");
    CHECK(format_size(1024) == "1.00 KB");
    CHECK(format_size(1536) == "1.50 KB");
    CHECK(format_size(5ull * 1024 * 1024) == "5.00 MB");
    CHECK(format_size(3ull * 1024 * 1024 * 1024 * 1024) == "3.00 TB");
}
