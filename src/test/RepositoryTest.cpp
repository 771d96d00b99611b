#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "domain/PlaylistEntry.hpp"
#include "infrastructure/FilePlaylistRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RunLogger.hpp"

using namespace streamsieve;
namespace fs = std::filesystem;

namespace {

const std::string kRoot = "test_repository_root";

int CountTempFiles(const fs::path& dir) {
    int count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") count++;
    }
    return count;
}

void TestAtomicWrites() {
    infrastructure::PersistenceService io;
    fs::path target = fs::path(kRoot) / "nested" / "dir" / "file.txt";

    io.writeTextAtomic(target, "first");
    assert(io.readText(target) == "first");
    io.writeTextAtomic(target, "second version");
    assert(io.readText(target) == "second version");
    assert(CountTempFiles(target.parent_path()) == 0);

    bool threw = false;
    try {
        io.readText(fs::path(kRoot) / "missing.txt");
    } catch (const domain::PersistError& e) {
        threw = e.path().find("missing.txt") != std::string::npos;
    }
    assert(threw);

    // A regular file where a directory is expected.
    threw = false;
    try {
        io.writeTextAtomic(target / "child.txt", "x");
    } catch (const domain::PersistError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Atomic writes replace content and leave no temporary files." << std::endl;
}

void TestReportLayout() {
    auto io = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::FilePlaylistRepository repo(kRoot + "/m3u_files", kRoot + "/processed", io);
    assert(fs::is_directory(kRoot + "/m3u_files"));
    assert(fs::is_directory(kRoot + "/processed"));

    repo.saveRawPlaylist("News", "#EXTM3U\n#EXTINF:-1,A\nhttp://a.test/1\n");
    assert(repo.rawPlaylistPath("News") == fs::path(kRoot) / "m3u_files" / "News.m3u");
    assert(repo.loadRawPlaylist("News") == "#EXTM3U\n#EXTINF:-1,A\nhttp://a.test/1\n");

    domain::PlaylistReport report;
    report.name = "News";
    report.available = {{"#EXTINF:-1,A", "http://a.test/1"}, {"#EXTINF:-1,B", "http://b.test/2"}};
    report.unavailable = {{"#EXTINF:-1,C", "http://c.test/3"}};
    repo.saveReport(report);

    assert(repo.availablePath("News") == fs::path(kRoot) / "processed" / "available_News.m3u");
    assert(repo.unavailablePath("News") == fs::path(kRoot) / "processed" / "unavailable_News.m3u");
    assert(io->readText(repo.availablePath("News")) ==
           "#EXTINF:-1,A\nhttp://a.test/1\n#EXTINF:-1,B\nhttp://b.test/2");
    assert(io->readText(repo.unavailablePath("News")) == "#EXTINF:-1,C\nhttp://c.test/3");

    // Rewriting a report replaces both files.
    report.available.clear();
    repo.saveReport(report);
    assert(io->readText(repo.availablePath("News")).empty());
    assert(CountTempFiles(kRoot + "/processed") == 0);

    bool threw = false;
    try {
        repo.loadRawPlaylist("Nope");
    } catch (const domain::PersistError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Report files follow the naming and line format." << std::endl;
}

void TestRunLogger() {
    const std::string logPath = kRoot + "/run.log";
    std::ostringstream out;
    std::ostringstream err;
    {
        infrastructure::RunLogger logger(logPath, out, err);
        assert(logger.hasFile());
        auto sink = logger.sink();
        sink(domain::LogLevel::Info, "Pipeline", "started");
        sink(domain::LogLevel::Error, "Pipeline", "exploded");
    }

    assert(out.str().find("[INFO] [Pipeline] started") != std::string::npos);
    assert(out.str().find("exploded") == std::string::npos);
    assert(err.str().find("[ERROR] [Pipeline] exploded") != std::string::npos);

    std::ifstream file(logPath);
    std::stringstream contents;
    contents << file.rdbuf();
    assert(contents.str().find("[INFO] [Pipeline] started") != std::string::npos);
    assert(contents.str().find("[ERROR] [Pipeline] exploded") != std::string::npos);

    std::ostringstream quiet;
    infrastructure::RunLogger consoleOnly("", quiet, quiet);
    assert(!consoleOnly.hasFile());
    std::cout << "[PASS] Log lines reach the console streams and the log file." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Repository Test..." << std::endl;
    fs::remove_all(kRoot);

    TestAtomicWrites();
    TestReportLayout();
    TestRunLogger();

    fs::remove_all(kRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
