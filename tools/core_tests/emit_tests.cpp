#include "destination.hpp"
#include "emit.hpp"
#include "errors.hpp"
#include "type_ref.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
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

// Returns canned models instead of parsing.
class FixedExtractor final : public InterfaceExtractor {
  public:
    explicit FixedExtractor(std::vector<InterfaceModel> models) : models_(std::move(models)) {}

    std::vector<InterfaceModel> extract(const SourceSpec &) override { return models_; }

  private:
    std::vector<InterfaceModel> models_;
};

InterfaceModel simple_model(std::string name, TypeRef param) {
    InterfaceModel model;
    model.interface_name = std::move(name);
    model.scope          = "shop";
    model.header         = "shop/api.h";
    MethodSignature method;
    method.name   = "use";
    method.params = {Parameter{"value", std::move(param)}};
    model.methods.push_back(method);
    return model;
}

std::string read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    Run t;

    const fs::path root = fs::temp_directory_path() / "mockforge_emit" / "my-project";
    std::error_code ec;
    fs::remove_all(root.parent_path(), ec);
    fs::create_directories(root);

    const std::vector<InterfaceModel> one{simple_model("Display", named_type("int"))};
    const std::vector<InterfaceModel> two{simple_model("Display", named_type("int")), simple_model("Screen", named_type("int"))};

    // Destination defaults
    {
        const auto plan = plan_destinations({}, two, root);
        t.expect(plan.namespace_name == "my_project_test", "namespace from the working directory, made an identifier");
        t.expect(plan.mock_paths.size() == 2 && plan.mock_paths[0] == root / "mock_display.h" && plan.mock_paths[1] == root / "mock_screen.h",
                 "one mock_<interface>.h per model");
        t.expect(plan.matchers_dir == root / "matchers", "matchers next to the mocks");

        DestinationOptions with_dir;
        with_dir.output_dir = root / "fakes";
        const auto dir_plan = plan_destinations(with_dir, one, root);
        t.expect(dir_plan.namespace_name == "fakes", "namespace from --output-dir");
        t.expect(dir_plan.mock_paths.front().parent_path().filename() == "fakes", "mock placed in --output-dir");

        DestinationOptions explicit_ns;
        explicit_ns.output         = "out/display_mock.h";
        explicit_ns.namespace_name = "doubles";
        explicit_ns.matchers_dir   = "m";
        const auto out_plan        = plan_destinations(explicit_ns, one, root);
        t.expect(out_plan.namespace_name == "doubles", "explicit namespace wins");
        t.expect(out_plan.mock_paths.front() == root / "out" / "display_mock.h", "--output relative to the working directory");
        t.expect(out_plan.matchers_dir == root / "m", "explicit matchers directory");

        bool threw = false;
        try {
            DestinationOptions both;
            both.output     = "a.h";
            both.output_dir = "b";
            (void)plan_destinations(both, one, root);
        } catch (const UsageError &) {
            threw = true;
        }
        t.expect(threw, "--output and --output-dir are exclusive");

        threw = false;
        try {
            DestinationOptions single;
            single.output = "a.h";
            (void)plan_destinations(single, two, root);
        } catch (const UsageError &) {
            threw = true;
        }
        t.expect(threw, "--output with several interfaces");
    }

    // Generation writes every file, and regenerating an unchanged model rewrites nothing
    {
        GenerateRequest request;
        request.working_dir       = root;
        request.generate_matchers = true;
        request.destination.output_dir = root / "gen";

        FixedExtractor extractor{{simple_model("Display", named_type("Widget", "shop", "shop/widget.h"))}};
        const auto     first = run_generate(request, extractor);
        t.expect(first.written.size() == 2 && first.unchanged.empty(), "mock and matcher written");
        t.expect(fs::exists(root / "gen" / "mock_display.h"), "mock file exists");
        t.expect(fs::exists(root / "gen" / "matchers" / "shop_widget.h"), "matcher file exists");
        t.expect(read_file(root / "gen" / "mock_display.h").find("namespace gen {") != std::string::npos, "namespace from output dir");

        const auto written_at = fs::last_write_time(root / "gen" / "mock_display.h");
        const auto second     = run_generate(request, extractor);
        t.expect(second.written.empty() && second.unchanged.size() == 2, "regeneration is idempotent");
        t.expect(fs::last_write_time(root / "gen" / "mock_display.h") == written_at, "unchanged file not touched");

        bool staged_left = false;
        for (const auto &entry : fs::recursive_directory_iterator(root / "gen")) {
            staged_left = staged_left || entry.path().extension() == ".tmp";
        }
        t.expect(!staged_left, "no staging files left behind");
    }

    // A failing run writes nothing
    {
        GenerateRequest request;
        request.working_dir            = root;
        request.destination.output_dir = root / "failing";

        FixedExtractor extractor{{simple_model("Good", named_type("int")), simple_model("Bad", named_type("Gadget", "tools"))}};
        bool           threw = false;
        try {
            (void)run_generate(request, extractor);
        } catch (const GenerationError &) {
            threw = true;
        }
        t.expect(threw, "rendering error propagates");
        t.expect(!fs::exists(root / "failing" / "mock_good.h"), "no file from a failed rendering");

        // The matcher directory cannot be created because a file is in the way.
        {
            std::ofstream blocker(root / "blocker");
            blocker << "x";
        }
        request.generate_matchers        = true;
        request.destination.matchers_dir = root / "blocker" / "matchers";
        FixedExtractor staged{{simple_model("Good", named_type("Widget", "shop", "shop/widget.h"))}};
        threw = false;
        try {
            (void)run_generate(request, staged);
        } catch (const FileError &) {
            threw = true;
        }
        t.expect(threw, "unwritable destination is a file error");
        t.expect(!fs::exists(root / "failing" / "mock_good.h"), "mock not published when a sibling write fails");
        t.expect(!fs::exists(root / "failing" / "mock_good.h.mockforge.tmp"), "staging file removed");
    }

    // Interfaces sharing a name in different namespaces would share a mock file
    {
        const fs::path dir = root / "clash";
        fs::create_directories(dir);
        {
            std::ofstream previous(dir / "mock_display.h");
            previous << "previous run\n";
        }

        InterfaceModel ui = simple_model("Display", named_type("int"));
        ui.scope          = "ui";
        GenerateRequest request;
        request.working_dir            = root;
        request.destination.output_dir = dir;
        FixedExtractor extractor{{simple_model("Display", named_type("int")), ui}};
        bool           threw = false;
        try {
            (void)run_generate(request, extractor);
        } catch (const UsageError &e) {
            threw = std::string(e.what()).find("shop::Display") != std::string::npos;
        }
        t.expect(threw, "shared destination rejected before writing");
        t.expect(read_file(dir / "mock_display.h") == "previous run\n", "existing mock left untouched");

        GenerateResult result;
        threw = false;
        try {
            write_files({{dir / "mock_display.h", "first"}, {dir / "." / "mock_display.h", "second"}}, result);
        } catch (const GenerationError &) {
            threw = true;
        }
        t.expect(threw && result.written.empty(), "duplicate destinations never staged");
        t.expect(read_file(dir / "mock_display.h") == "previous run\n", "nothing replaced");
    }

    // End to end through the syntactic backend
    {
        const fs::path header = root / "shop" / "api.h";
        fs::create_directories(header.parent_path());
        {
            std::ofstream out(header);
            out << "#pragma once\n#include <string>\nnamespace shop {\nclass Clock {\n  public:\n    virtual ~Clock() = default;\n"
                   "    virtual long now(const std::string &zone) const = 0;\n};\n}\n";
        }
        GenerateRequest request;
        request.working_dir         = root;
        request.backend             = ExtractorKind::Syntactic;
        request.source.header       = header;
        request.source.include_dirs = {root};
        const auto result           = run_generate(request);
        t.expect(result.written.size() == 1 && result.written.front() == root / "mock_clock.h", "default destination in the working directory");
        const std::string text = read_file(root / "mock_clock.h");
        t.expect(text.find("long now(const ::std::string &zone) const override") != std::string::npos, "generated override");
        t.expect(text.find("#include \"shop/api.h\"") != std::string::npos, "interface header included");
    }

    fs::remove_all(root.parent_path(), ec);

    if (t.failures != 0) {
        std::cerr << t.failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
