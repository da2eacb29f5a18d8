// Watch mode: regenerate mocks listed in `interfaces_to_mock` files when their
// sources change.
#pragma once

#include "emit.hpp"
#include "extractor.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mockforge::codegen {

inline constexpr const char *kInterfaceListFile = "interfaces_to_mock";

// One line of an interface list: `<header> [Interface...]`.
struct InterfaceListEntry {
    std::string              header;
    std::vector<std::string> interfaces;
    std::string              line; // trimmed source line, part of the fingerprint
};

std::vector<InterfaceListEntry> parse_interface_list(std::string_view text);

// Create an explanatory `interfaces_to_mock` in every directory that lacks one.
// Returns the files created.
std::vector<std::filesystem::path> ensure_interface_list_files(const std::vector<std::filesystem::path> &directories);

inline constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ull;

// 64-bit FNV-1a; pass a previous result as `seed` to continue hashing.
std::uint64_t fnv1a(std::string_view data, std::uint64_t seed = kFnvOffsetBasis);

// At most one run per key is in flight. A submission arriving while its key is
// running is parked; several parked submissions collapse into the latest one,
// which the running caller executes once the current run finishes.
class RunSerializer {
  public:
    using Job = std::function<void()>;

    // Returns true if this call executed `job` (and any reruns parked meanwhile),
    // false if it was parked behind a running job.
    bool submit(const std::string &key, Job job);

    // Block until no job is in flight for any key.
    void wait_idle();

  private:
    std::mutex                 mutex_;
    std::condition_variable    idle_;
    std::set<std::string>      running_;
    std::map<std::string, Job> pending_;
};

// - directories: watched directories, each with its own list file
// - recursive: also scan sub-directories for list files
// - extractor / include_dirs: forwarded to every generation request
struct WatchOptions {
    std::vector<std::filesystem::path> directories;
    bool                               recursive = false;
    std::chrono::milliseconds          interval{2000};
    ExtractorConfig                    extractor;
    std::vector<std::filesystem::path> include_dirs;
};

class MockFileUpdater {
  public:
    using GenerateFn = std::function<GenerateResult(const GenerateRequest &)>;

    explicit MockFileUpdater(WatchOptions options, GenerateFn generate = {});

    // Scan every list file once and regenerate stale entries. Failures are
    // logged and skipped. Returns the number of entries regenerated.
    std::size_t update();

  private:
    struct EntryState {
        std::uint64_t                      fingerprint = 0;
        std::vector<std::filesystem::path> outputs;
    };

    std::vector<std::filesystem::path> list_directories() const;
    bool                               regenerate(const std::filesystem::path &dir, const InterfaceListEntry &entry, std::uint64_t fingerprint);

    WatchOptions                      options_;
    GenerateFn                        generate_;
    RunSerializer                     serializer_;
    std::map<std::string, EntryState> entries_;
};

// Calls `tick` on a worker thread every interval until stopped.
class Watcher {
  public:
    Watcher(std::function<void()> tick, std::chrono::milliseconds interval);
    ~Watcher();

    Watcher(const Watcher &)            = delete;
    Watcher &operator=(const Watcher &) = delete;

    void start();
    // Wakes the worker and waits for an in-flight tick to finish.
    void stop();

    [[nodiscard]] bool running() const;

  private:
    void loop();

    std::function<void()>     tick_;
    std::chrono::milliseconds interval_;
    mutable std::mutex        mutex_;
    std::condition_variable   wake_;
    bool                      stop_requested_ = false;
    std::thread               worker_;
};

} // namespace mockforge::codegen
