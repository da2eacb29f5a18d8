#include "errors.hpp"
#include "watch.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace mockforge::codegen;

struct Run {
    int failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
};

namespace {

void write_file(const fs::path &path, std::string_view text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

// Latch used to hold a job inside RunSerializer::submit.
struct Gate {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    entered = false;
    bool                    open    = false;

    void enter_and_wait() {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return open; });
    }
    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return entered; });
    }
    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
        cv.notify_all();
    }
};

} // namespace

int main() {
    Run t;

    // List parsing
    {
        const auto entries = parse_interface_list("# comment\n\nshop/display.h Display Screen  # trailing\n  clock.h\r\n");
        t.expect(entries.size() == 2, "comments and blank lines skipped");
        if (entries.size() == 2) {
            t.expect(entries[0].header == "shop/display.h", "header parsed");
            t.expect(entries[0].interfaces == std::vector<std::string>{"Display", "Screen"}, "interfaces parsed");
            t.expect(entries[0].line == "shop/display.h Display Screen", "line trimmed of comments");
            t.expect(entries[1].header == "clock.h" && entries[1].interfaces.empty(), "header without interfaces");
        }
    }

    // Fingerprints
    {
        t.expect(fnv1a("") == kFnvOffsetBasis, "empty input yields the offset basis");
        t.expect(fnv1a("a") == 0xaf63dc4c8601ec8cull, "FNV-1a of 'a'");
        t.expect(fnv1a("b", fnv1a("a")) == fnv1a("ab"), "seeding continues the hash");
    }

    const fs::path root = fs::temp_directory_path() / "mockforge_watch";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "pkg" / "nested");

    // List files are created once
    {
        const auto created = ensure_interface_list_files({root / "pkg"});
        t.expect(created.size() == 1 && fs::exists(root / "pkg" / kInterfaceListFile), "list file created");
        std::ifstream in(root / "pkg" / kInterfaceListFile);
        std::string   first;
        std::getline(in, first);
        t.expect(!first.empty() && first.front() == '#', "list file starts with a comment");
        t.expect(parse_interface_list("# only comments\n").empty(), "template has no entries");
        t.expect(ensure_interface_list_files({root / "pkg"}).empty(), "existing list file left alone");
    }

    // Serializer: a trigger during a run is parked, and several triggers collapse into the latest
    {
        RunSerializer    serializer;
        Gate             gate;
        std::vector<int> order;
        std::mutex       order_mutex;
        const auto       record = [&](int id) {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(id);
        };

        std::thread first([&] { serializer.submit("pkg", [&] { record(1); gate.enter_and_wait(); }); });
        gate.wait_entered();
        const bool ran_second = serializer.submit("pkg", [&] { record(2); });
        const bool ran_third  = serializer.submit("pkg", [&] { record(3); });
        const bool ran_other  = serializer.submit("other", [&] { record(4); });
        gate.release();
        first.join();
        serializer.wait_idle();

        t.expect(!ran_second && !ran_third, "triggers during a run are parked");
        t.expect(ran_other, "other keys run independently");
        t.expect(order == std::vector<int>({1, 4, 3}), "parked triggers coalesce into the latest one");
    }

    // A job that throws releases its key
    {
        RunSerializer serializer;
        bool          rethrown = false;
        try {
            serializer.submit("pkg", [] { throw std::runtime_error("disk full"); });
        } catch (const std::runtime_error &) {
            rethrown = true;
        }
        bool       ran  = false;
        const bool took = serializer.submit("pkg", [&] { ran = true; });
        serializer.wait_idle();
        t.expect(rethrown, "job failure reaches the caller");
        t.expect(took && ran, "key usable again after a failed job");
    }

    // Updater regenerates only when the entry or the header changed, or the output vanished
    {
        write_file(root / "pkg" / kInterfaceListFile, "api.h Display\n");
        write_file(root / "pkg" / "api.h", "struct Display { virtual void show() = 0; };\n");
        write_file(root / "pkg" / "nested" / kInterfaceListFile, "# nothing yet\n");

        std::vector<GenerateRequest> requests;
        WatchOptions                 options;
        options.directories = {root};
        options.recursive   = true;
        MockFileUpdater updater{options, [&](const GenerateRequest &request) {
                                    requests.push_back(request);
                                    write_file(request.destination.output_dir / "mock_display.h", "// mock\n");
                                    GenerateResult result;
                                    result.written.push_back(request.destination.output_dir / "mock_display.h");
                                    return result;
                                }};

        t.expect(updater.update() == 1, "first scan generates the entry");
        t.expect(fs::exists(root / kInterfaceListFile), "watched root gets a list file");
        if (requests.size() == 1) {
            t.expect(requests[0].source.header == root / "pkg" / "api.h", "header resolved against the list directory");
            t.expect(requests[0].source.interfaces == std::vector<std::string>{"Display"}, "interfaces forwarded");
            t.expect(requests[0].backend == ExtractorKind::Reflective, "watch uses the reflective backend");
        }
        t.expect(updater.update() == 0, "unchanged entry is skipped");

        write_file(root / "pkg" / "api.h", "struct Display { virtual void show(int times) = 0; };\n");
        t.expect(updater.update() == 1, "header change triggers regeneration");

        fs::remove(root / "pkg" / "mock_display.h");
        t.expect(updater.update() == 1, "missing output triggers regeneration");
        t.expect(requests.size() == 3, "three generations in total");
    }

    // Failures are logged and do not stop the updater
    {
        write_file(root / "bad" / kInterfaceListFile, "missing.h\nbroken.h\n");
        write_file(root / "bad" / "broken.h", "struct Broken;\n");
        int          calls = 0;
        WatchOptions options;
        options.directories = {root / "bad"};
        MockFileUpdater updater{options, [&](const GenerateRequest &) -> GenerateResult {
                                    ++calls;
                                    throw ExtractionError("broken.h: no interfaces declared");
                                }};
        t.expect(updater.update() == 0, "failed entry is not counted");
        t.expect(calls == 1, "unreadable header skipped before generation");
        t.expect(updater.update() == 0 && calls == 1, "failed entry retried only after it changes");
    }

    // A tick that throws does not end the loop
    {
        std::atomic<int> ticks{0};
        Watcher          watcher{[&] {
                            ++ticks;
                            throw std::runtime_error("unexpected");
                        },
                        std::chrono::milliseconds(10)};
        watcher.start();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (ticks.load() < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        watcher.stop();
        t.expect(ticks.load() >= 3, "polling continues after a failing tick");
    }

    // Watcher ticks until stopped
    {
        std::atomic<int> ticks{0};
        Watcher          watcher{[&] { ++ticks; }, std::chrono::milliseconds(10)};
        watcher.start();
        t.expect(watcher.running(), "running after start");
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (ticks.load() < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        watcher.stop();
        t.expect(ticks.load() >= 3, "ticks repeatedly");
        t.expect(!watcher.running(), "stopped");
        const int after_stop = ticks.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        t.expect(ticks.load() == after_stop, "no ticks after stop");
    }

    fs::remove_all(root, ec);

    if (t.failures != 0) {
        std::cerr << t.failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
