#include "watch.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "path_utils.hpp"

#include <exception>
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace mockforge::codegen {

namespace {

constexpr std::string_view kListTemplate = "# Headers whose interfaces mockforge watch keeps mocked, one per line:\n"
                                           "#\n"
                                           "#   <header> [Interface...]\n"
                                           "#\n"
                                           "# Paths are relative to this directory. Without interface names every\n"
                                           "# interface the header declares is mocked. Mocks are written next to this file.\n"
                                           "#\n"
                                           "# display.h Display\n";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::optional<std::string> read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

std::vector<InterfaceListEntry> parse_interface_list(std::string_view text) {
    std::vector<InterfaceListEntry> entries;
    while (!text.empty()) {
        const auto       eol  = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text                  = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

        if (const auto hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        InterfaceListEntry entry;
        entry.line = std::string(line);
        std::istringstream words(entry.line);
        words >> entry.header;
        for (std::string name; words >> name;) {
            entry.interfaces.push_back(std::move(name));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<fs::path> ensure_interface_list_files(const std::vector<fs::path> &directories) {
    std::vector<fs::path> created;
    for (const auto &dir : directories) {
        const fs::path  list = dir / kInterfaceListFile;
        std::error_code ec;
        if (fs::exists(list, ec) || ec) {
            continue;
        }
        std::ofstream out(list, std::ios::binary);
        out << kListTemplate;
        out.close();
        if (!out) {
            log_err("failed to create {}", list.string());
            continue;
        }
        log_info("created {}", list.string());
        created.push_back(list);
    }
    return created;
}

std::uint64_t fnv1a(std::string_view data, std::uint64_t seed) {
    constexpr std::uint64_t kPrime = 1099511628211ull;
    std::uint64_t           hash   = seed;
    for (const char c : data) {
        hash ^= static_cast<unsigned char>(c);
        hash *= kPrime;
    }
    return hash;
}

bool RunSerializer::submit(const std::string &key, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.count(key) != 0) {
            pending_[key] = std::move(job);
            return false;
        }
        running_.insert(key);
    }

    while (true) {
        try {
            job();
        } catch (...) {
            // A failed run releases the key; a run parked behind it is dropped with it.
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(key);
            running_.erase(key);
            if (running_.empty()) {
                idle_.notify_all();
            }
            throw;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = pending_.find(key);
        if (it == pending_.end()) {
            running_.erase(key);
            if (running_.empty()) {
                idle_.notify_all();
            }
            return true;
        }
        job = std::move(it->second);
        pending_.erase(it);
    }
}

void RunSerializer::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return running_.empty(); });
}

MockFileUpdater::MockFileUpdater(WatchOptions options, GenerateFn generate)
    : options_(std::move(options)), generate_(std::move(generate)) {
    if (!generate_) {
        generate_ = [](const GenerateRequest &request) { return run_generate(request); };
    }
}

std::vector<fs::path> MockFileUpdater::list_directories() const {
    std::vector<fs::path> dirs;
    for (const auto &root : options_.directories) {
        std::error_code ec;
        if (fs::exists(root / kInterfaceListFile, ec)) {
            dirs.push_back(root);
        }
        if (!options_.recursive) {
            continue;
        }
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && fs::exists(it->path() / kInterfaceListFile, entry_ec)) {
                dirs.push_back(it->path());
            }
        }
        if (ec) {
            log_err("failed to scan {}: {}", root.string(), ec.message());
        }
    }
    return dirs;
}

bool MockFileUpdater::regenerate(const fs::path &dir, const InterfaceListEntry &entry, std::uint64_t fingerprint) {
    GenerateRequest request;
    request.source.header     = fs::path(entry.header).is_absolute() ? fs::path(entry.header) : dir / entry.header;
    request.source.interfaces = entry.interfaces;
    request.source.include_dirs = options_.include_dirs;
    request.source.include_dirs.push_back(dir);
    request.backend                = ExtractorKind::Reflective;
    request.extractor              = options_.extractor;
    request.destination.output_dir = dir;
    request.working_dir            = dir;

    const std::string key   = normalize_path(dir).generic_string() + "|" + entry.line;
    EntryState       &state = entries_[key];
    state.fingerprint       = fingerprint;
    try {
        const GenerateResult result = generate_(request);
        state.outputs               = result.written;
        state.outputs.insert(state.outputs.end(), result.unchanged.begin(), result.unchanged.end());
        for (const auto &path : result.written) {
            log_info("regenerated {}", path.string());
        }
        return true;
    } catch (const Error &e) {
        state.outputs.clear();
        log_err("{}: {}", request.source.header.string(), e.what());
        return false;
    } catch (const std::exception &e) {
        state.outputs.clear();
        log_err("{}: unexpected failure: {}", request.source.header.string(), e.what());
        return false;
    }
}

std::size_t MockFileUpdater::update() {
    ensure_interface_list_files(options_.directories);

    std::size_t regenerated = 0;
    for (const auto &dir : list_directories()) {
        const auto list = read_file(dir / kInterfaceListFile);
        if (!list) {
            log_err("failed to read {}", (dir / kInterfaceListFile).string());
            continue;
        }
        for (const auto &entry : parse_interface_list(*list)) {
            const fs::path header  = fs::path(entry.header).is_absolute() ? fs::path(entry.header) : dir / entry.header;
            const auto     content = read_file(header);
            if (!content) {
                log_err("{}: listed header {} cannot be read", (dir / kInterfaceListFile).string(), entry.header);
                continue;
            }
            const std::uint64_t fingerprint = fnv1a(*content, fnv1a(entry.line));
            const std::string   key         = normalize_path(dir).generic_string() + "|" + entry.line;

            if (const auto it = entries_.find(key); it != entries_.end() && it->second.fingerprint == fingerprint) {
                bool outputs_present = true;
                for (const auto &output : it->second.outputs) {
                    std::error_code ec;
                    outputs_present = outputs_present && fs::exists(output, ec);
                }
                if (outputs_present) {
                    continue;
                }
            }

            bool succeeded = false;
            serializer_.submit(key, [&, fingerprint] { succeeded = regenerate(dir, entry, fingerprint); });
            if (succeeded) {
                ++regenerated;
            }
        }
    }
    return regenerated;
}

Watcher::Watcher(std::function<void()> tick, std::chrono::milliseconds interval) : tick_(std::move(tick)), interval_(interval) {}

Watcher::~Watcher() { stop(); }

void Watcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_         = std::thread([this] { loop(); });
}

void Watcher::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        worker          = std::move(worker_);
    }
    wake_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

bool Watcher::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !stop_requested_;
}

void Watcher::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        try {
            tick_();
        } catch (const Error &e) {
            log_err("watch: {}", e.what());
        } catch (const std::exception &e) {
            log_err("watch: unexpected failure: {}", e.what());
        }
        lock.lock();
        wake_.wait_for(lock, interval_, [this] { return stop_requested_; });
    }
}

} // namespace mockforge::codegen
