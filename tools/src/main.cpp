#include "emit.hpp"
#include "errors.hpp"
#include "extractor.hpp"
#include "log.hpp"
#include "remove.hpp"
#include "watch.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <llvm/Support/CommandLine.h>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace mockforge::codegen;

namespace {

llvm::cl::OptionCategory category{"mockforge"};

llvm::cl::SubCommand generate_cmd{"generate", "Generate mocks for the interfaces declared in a header"};
llvm::cl::SubCommand watch_cmd{"watch", "Regenerate mocks listed in interfaces_to_mock files when their headers change"};
llvm::cl::SubCommand remove_cmd{"remove", "Remove files generated by mockforge"};

// generate
llvm::cl::list<std::string> generate_args{llvm::cl::Positional, llvm::cl::desc("<header> [Interface...]"), llvm::cl::OneOrMore,
                                          llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::opt<std::string>  output_option{"output", llvm::cl::desc("Output file; defaults to mock_<interface>.h"), llvm::cl::init(""),
                                         llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::alias             output_alias{"o", llvm::cl::desc("Alias for --output"), llvm::cl::aliasopt(output_option)};
llvm::cl::opt<std::string>  output_dir_option{"output-dir",
                                             llvm::cl::desc("Output directory; the namespace defaults to its name unless --namespace is given"),
                                             llvm::cl::init(""), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::opt<std::string>  namespace_option{"namespace",
                                            llvm::cl::desc("Namespace of the generated mocks; defaults to <working directory>_test"),
                                            llvm::cl::init(""), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::opt<std::string>  self_namespace_option{"self-namespace", llvm::cl::desc("Namespace whose types the mock refers to unqualified"),
                                                 llvm::cl::init(""), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::opt<bool> debug_option{"debug", llvm::cl::desc("Print the extracted interface models"), llvm::cl::init(false),
                                 llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::alias     debug_alias{"d", llvm::cl::desc("Alias for --debug"), llvm::cl::aliasopt(debug_option)};
llvm::cl::opt<bool> syntactic_option{"syntactic",
                                     llvm::cl::desc("Parse the header directly instead of compiling it; keeps parameter names, one interface only"),
                                     llvm::cl::init(false), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::opt<bool> matchers_option{"generate-matchers", llvm::cl::desc("Generate typed matchers for every non built-in parameter type"),
                                    llvm::cl::init(false), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::alias     matchers_alias{"m", llvm::cl::desc("Alias for --generate-matchers"), llvm::cl::aliasopt(matchers_option)};
llvm::cl::opt<std::string> matchers_dir_option{"matchers-dir", llvm::cl::desc("Directory for generated matchers; defaults to <mockdir>/matchers"),
                                               llvm::cl::init(""), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};
llvm::cl::alias            matchers_dir_alias{"p", llvm::cl::desc("Alias for --matchers-dir"), llvm::cl::aliasopt(matchers_dir_option)};
llvm::cl::opt<std::string> matchers_namespace_option{"matchers-namespace", llvm::cl::desc("Namespace of the generated matchers"),
                                                     llvm::cl::init("matchers"), llvm::cl::sub(generate_cmd), llvm::cl::cat(category)};

// generate + watch
llvm::cl::list<std::string> include_option{"I", llvm::cl::Prefix, llvm::cl::desc("Include directory"), llvm::cl::ZeroOrMore,
                                           llvm::cl::sub(generate_cmd), llvm::cl::sub(watch_cmd), llvm::cl::cat(category)};
llvm::cl::list<std::string> extra_arg_option{"extra-arg", llvm::cl::desc("Additional compiler argument"), llvm::cl::ZeroOrMore,
                                             llvm::cl::sub(generate_cmd), llvm::cl::sub(watch_cmd), llvm::cl::cat(category)};
llvm::cl::opt<std::string>  compdb_option{"compdb", llvm::cl::desc("Directory containing compile_commands.json"), llvm::cl::init(""),
                                         llvm::cl::sub(generate_cmd), llvm::cl::sub(watch_cmd), llvm::cl::cat(category)};

// watch
llvm::cl::list<std::string> watch_dirs{llvm::cl::Positional, llvm::cl::desc("[dir...]"), llvm::cl::ZeroOrMore, llvm::cl::sub(watch_cmd),
                                       llvm::cl::cat(category)};
llvm::cl::opt<bool>         watch_recursive{"recursive", llvm::cl::desc("Watch sub-directories as well"), llvm::cl::init(false),
                                    llvm::cl::sub(watch_cmd), llvm::cl::cat(category)};
llvm::cl::alias             watch_recursive_alias{"r", llvm::cl::desc("Alias for --recursive"), llvm::cl::aliasopt(watch_recursive)};

// remove
llvm::cl::opt<std::string> remove_path{llvm::cl::Positional, llvm::cl::desc("[path]"), llvm::cl::init(""), llvm::cl::sub(remove_cmd),
                                       llvm::cl::cat(category)};
llvm::cl::opt<bool>        remove_recursive{"recursive", llvm::cl::desc("Remove in all sub-directories"), llvm::cl::init(false),
                                     llvm::cl::sub(remove_cmd), llvm::cl::cat(category)};
llvm::cl::alias            remove_recursive_alias{"r", llvm::cl::desc("Alias for --recursive"), llvm::cl::aliasopt(remove_recursive)};
llvm::cl::opt<bool>        remove_non_interactive{"non-interactive", llvm::cl::desc("Do not ask for confirmation"), llvm::cl::init(false),
                                           llvm::cl::sub(remove_cmd), llvm::cl::cat(category)};
llvm::cl::alias            remove_non_interactive_alias{"n", llvm::cl::desc("Alias for --non-interactive"), llvm::cl::aliasopt(remove_non_interactive)};
llvm::cl::opt<bool>        remove_dry_run{"dry-run", llvm::cl::desc("Show what would be deleted without deleting"), llvm::cl::init(false),
                                   llvm::cl::sub(remove_cmd), llvm::cl::cat(category)};
llvm::cl::alias            remove_dry_run_alias{"d", llvm::cl::desc("Alias for --dry-run"), llvm::cl::aliasopt(remove_dry_run)};
llvm::cl::opt<bool>        remove_silent{"silent", llvm::cl::desc("Write nothing to standard output"), llvm::cl::init(false),
                                  llvm::cl::sub(remove_cmd), llvm::cl::cat(category)};
llvm::cl::alias            remove_silent_alias{"s", llvm::cl::desc("Alias for --silent"), llvm::cl::aliasopt(remove_silent)};

std::atomic<bool> interrupted{false};

void on_interrupt(int) { interrupted.store(true); }

std::vector<fs::path> include_dirs() { return std::vector<fs::path>(include_option.begin(), include_option.end()); }

ExtractorConfig extractor_config() {
    ExtractorConfig config;
    if (!compdb_option.getValue().empty()) {
        config.compilation_database = fs::path{compdb_option.getValue()};
    }
    config.extra_args.assign(extra_arg_option.begin(), extra_arg_option.end());
    return config;
}

int run_generate_command() {
    GenerateRequest request;
    request.source.header = fs::path{generate_args.front()};
    request.source.interfaces.assign(std::next(generate_args.begin()), generate_args.end());
    request.source.include_dirs = include_dirs();
    request.backend             = syntactic_option ? ExtractorKind::Syntactic : ExtractorKind::Reflective;
    request.extractor           = extractor_config();
    request.destination.output         = fs::path{output_option.getValue()};
    request.destination.output_dir     = fs::path{output_dir_option.getValue()};
    request.destination.namespace_name = namespace_option;
    request.destination.matchers_dir   = fs::path{matchers_dir_option.getValue()};
    request.self_namespace             = self_namespace_option;
    request.generate_matchers          = matchers_option;
    request.matchers_namespace         = matchers_namespace_option;

    if (syntactic_option && request.source.interfaces.size() > 1) {
        throw UsageError("--syntactic handles a single interface per run");
    }
    set_debug_logging(debug_option);

    const GenerateResult result = run_generate(request);
    for (const auto &path : result.written) {
        log_info("wrote {}", path.string());
    }
    return 0;
}

int run_watch_command() {
    WatchOptions options;
    if (watch_dirs.empty()) {
        options.directories.push_back(fs::current_path());
    } else {
        options.directories.assign(watch_dirs.begin(), watch_dirs.end());
    }
    options.recursive    = watch_recursive;
    options.extractor    = extractor_config();
    options.include_dirs = include_dirs();

    ensure_interface_list_files(options.directories);

    MockFileUpdater updater{options};
    Watcher         watcher{[&updater] { updater.update(); }, options.interval};
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
    watcher.start();
    while (!interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    watcher.stop();
    return 0;
}

int run_remove_command() {
    RemoveOptions options;
    options.root        = remove_path.getValue().empty() ? fs::current_path() : fs::path{remove_path.getValue()};
    options.recursive   = remove_recursive;
    options.interactive = !remove_non_interactive;
    options.dry_run     = remove_dry_run;
    options.silent      = remove_silent;
    remove_mocks(options, std::cout, std::cin);
    return 0;
}

} // namespace

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(category);
    llvm::cl::ParseCommandLineOptions(argc, argv, "mockforge: mock generator for C++ interfaces\n");

    try {
        if (generate_cmd) {
            return run_generate_command();
        }
        if (watch_cmd) {
            return run_watch_command();
        }
        if (remove_cmd) {
            return run_remove_command();
        }
    } catch (const Error &e) {
        log_err("{}", e.what());
        return 1;
    }
    llvm::cl::PrintHelpMessage();
    return 1;
}
