#include "errors.hpp"
#include "model.hpp"
#include "remove.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
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

fs::path make_tree() {
    const fs::path root = fs::temp_directory_path() / "mockforge_remove";
    std::error_code ec;
    fs::remove_all(root, ec);
    const std::string generated = std::string(kGeneratedMarker) + "\n#pragma once\n";
    write_file(root / "mock_display.h", generated);
    write_file(root / "mock_clock.h", generated);
    write_file(root / "display.h", "#pragma once\n// " + std::string(kGeneratedMarker) + "\n");
    write_file(root / "notes.txt", generated);
    write_file(root / "sub" / "mock_screen.h", generated);
    return root;
}

} // namespace

int main() {
    Run t;

    // Discovery keys on the first line only
    {
        const fs::path root  = make_tree();
        const auto     found = find_generated_files(root, false);
        t.expect(found == std::vector<fs::path>{root / "mock_clock.h", root / "mock_display.h"}, "marker on the first line of a header, sorted");
        t.expect(find_generated_files(root, true).size() == 3, "recursive search descends");
    }

    // Dry run reports without deleting
    {
        const fs::path     root = make_tree();
        std::ostringstream out;
        std::istringstream in;
        const auto affected = remove_mocks(RemoveOptions{root, true, false, true, false}, out, in);
        t.expect(affected.size() == 3, "dry run reports every file");
        t.expect(fs::exists(root / "mock_display.h") && fs::exists(root / "sub" / "mock_screen.h"), "dry run deletes nothing");
        t.expect(out.str().find("Would delete") != std::string::npos, "dry run says what it would do");
    }

    // Interactive mode asks per file; declining skips it
    {
        const fs::path     root = make_tree();
        std::ostringstream out;
        std::istringstream in("y\nn\n");
        const auto affected = remove_mocks(RemoveOptions{root, false, true, false, false}, out, in);
        t.expect(affected == std::vector<fs::path>{root / "mock_clock.h"}, "only the confirmed file deleted");
        t.expect(!fs::exists(root / "mock_clock.h") && fs::exists(root / "mock_display.h"), "declined file kept");
        t.expect(out.str().find("Delete " + (root / "mock_display.h").string() + "? [y/N]") != std::string::npos, "prompt per file");
    }

    // Silent, non-interactive removal through the injected remover
    {
        const fs::path        root = make_tree();
        std::ostringstream    out;
        std::istringstream    in;
        std::vector<fs::path> removed;
        const auto affected = remove_mocks(RemoveOptions{root, true, false, false, true}, out, in, [&](const fs::path &path) {
            removed.push_back(path);
            return std::error_code{};
        });
        t.expect(affected.size() == 3 && removed.size() == 3, "every generated file handed to the remover");
        t.expect(out.str().empty(), "silent mode writes nothing");
        t.expect(fs::exists(root / "display.h") && fs::exists(root / "notes.txt"), "hand-written files never considered");
    }

    // Removal errors propagate
    {
        const fs::path     root = make_tree();
        std::ostringstream out;
        std::istringstream in;
        bool               threw = false;
        try {
            (void)remove_mocks(RemoveOptions{root, false, false, false, true}, out, in,
                               [](const fs::path &) { return std::make_error_code(std::errc::permission_denied); });
        } catch (const FileError &e) {
            threw = e.path().filename() == "mock_clock.h";
        }
        t.expect(threw, "remover failure raises FileError for the file");
    }

    std::error_code ec;
    fs::remove_all(fs::temp_directory_path() / "mockforge_remove", ec);

    if (t.failures != 0) {
        std::cerr << t.failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
