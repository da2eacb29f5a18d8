#include "errors.hpp"
#include "extractor.hpp"
#include "tooling_support.hpp"
#include "type_ref.hpp"
#include "validate.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
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

// Exercises aliases, containers, owners, std::function, tuples and base flattening.
constexpr std::string_view kStoreHeader = R"(#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace store {

struct Item {
    std::string name;
};

using ItemId   = std::uint64_t;
using Callback = std::function<bool(const Item &, int)>;

class Named {
  public:
    virtual ~Named() = default;
    virtual std::string name() const = 0;
};

class Catalog : public Named {
  public:
    virtual std::tuple<Item, bool> get(ItemId id) = 0;
    virtual void put(const std::string &key, std::unique_ptr<Item> item) = 0;
    virtual std::map<std::string, std::vector<Item>> groups(std::size_t limit) const = 0;
    virtual void each(Callback visit, std::initializer_list<ItemId> ids) = 0;
    virtual Item *find(const char *name, Item &&hint) noexcept = 0;
};

class Ledger {
  public:
    virtual ~Ledger() = default;
    virtual void post(double amount) = 0;
};

} // namespace store
)";

} // namespace

int main() {
    Run t;

    const fs::path dir = fs::temp_directory_path() / "mockforge_reflective";
    std::error_code ec;
    fs::remove_all(dir, ec);
    write_file(dir / "store" / "catalog.h", kStoreHeader);

    const SourceSpec spec{dir / "store" / "catalog.h", {"store::Catalog"}, {dir}};

    std::vector<InterfaceModel> reflective;
    std::vector<InterfaceModel> syntactic;
    try {
        reflective = make_extractor(ExtractorKind::Reflective)->extract(spec);
        syntactic  = make_extractor(ExtractorKind::Syntactic)->extract(spec);
    } catch (const Error &e) {
        std::cerr << "FAIL: extraction failed: " << e.what() << "\n";
        return 1;
    }

    t.expect(reflective.size() == 1 && syntactic.size() == 1, "one model per backend");
    if (reflective.size() == 1 && syntactic.size() == 1) {
        const auto &r = reflective.front();
        const auto &s = syntactic.front();
        t.expect(models_equivalent(r, s), "backends produce equivalent models");
        if (!models_equivalent(r, s)) {
            std::cerr << "reflective:\n" << describe_model(r) << "syntactic:\n" << describe_model(s);
        }
        t.expect(r.header == "store/catalog.h", "header spelled relative to the include directory");
        t.expect(!r.methods.empty() && r.methods.front().name == "name", "base methods come first");
        t.expect(r.methods.size() == 6 && r.methods[1].params.front().name == "p0", "reflective parameter names are synthesized");
        t.expect(s.methods.size() == 6 && s.methods[1].params.front().name == "id", "syntactic parameter names are kept");
        if (r.methods.size() == 6) {
            t.expect(r.methods[1].aggregate == ResultAggregate::Tuple && r.methods[1].results.size() == 2, "tuple result expanded");
            t.expect(render_type(r.methods[1].params[0].type) == "::std::uint64_t", "std alias preserved through a project alias");
            t.expect(r.methods[2].params[1].type.kind == TypeKind::Owner, "unique_ptr parameter");
            t.expect(render_type(r.methods[3].results[0]) == "::std::map<::std::string, ::std::vector<::store::Item>>", "nested containers");
            t.expect(r.methods[4].params[0].type.kind == TypeKind::Function, "std::function alias");
            t.expect(r.methods[4].params[1].type.is_variadic, "initializer_list is variadic");
            t.expect(r.methods[5].is_noexcept && r.methods[5].params[1].type.kind == TypeKind::RValueRef, "rvalue reference and noexcept");
        }
    }

    // Without names, every interface declared in the header is extracted.
    {
        const auto all = make_extractor(ExtractorKind::Reflective)->extract(SourceSpec{spec.header, {}, {dir}});
        std::vector<std::string> names;
        for (const auto &model : all) {
            names.push_back(model.interface_name);
        }
        t.expect(names == std::vector<std::string>{"Named", "Catalog", "Ledger"}, "declaration order");
    }

    // Project typedefs named like standard ones resolve to their targets.
    {
        write_file(dir / "raw" / "codec.h", R"(#pragma once
typedef unsigned char byte;
typedef char *string;

class Codec {
  public:
    virtual ~Codec() = default;
    virtual int put(byte value, string name) = 0;
};
)");
        const SourceSpec raw{dir / "raw" / "codec.h", {"Codec"}, {dir}};
        const auto       r = make_extractor(ExtractorKind::Reflective)->extract(raw);
        const auto       s = make_extractor(ExtractorKind::Syntactic)->extract(raw);
        t.expect(r.size() == 1 && s.size() == 1 && models_equivalent(r.front(), s.front()), "global project typedefs agree across backends");
        if (r.size() == 1 && r.front().methods.size() == 1 && r.front().methods.front().params.size() == 2) {
            t.expect(render_type(r.front().methods.front().params[0].type) == "unsigned char", "byte is the project's, not std::byte");
            t.expect(render_type(r.front().methods.front().params[1].type) == "char *", "string is the project's, not std::string");
        }
    }

    // Host include discovery tolerates missing and odd directory layouts.
    {
        const fs::path versions = dir / "versions";
        for (const char *name : {"9", "12", "12.1", "abc", "12.x", "99999999999"}) {
            fs::create_directories(versions / name);
        }
        write_file(versions / "13", "not a directory");
        const auto latest = latest_version_dir(versions);
        t.expect(latest && latest->filename() == "12.1", "newest version-named directory");
        t.expect(subdirectories(versions).size() == 6, "plain files are not subdirectories");
        t.expect(subdirectories(dir / "absent").empty() && !latest_version_dir(dir / "absent"), "missing root yields nothing");
        t.expect(!latest_version_dir(versions / "13"), "file root yields nothing");
    }

    // Several named interfaces in one run.
    {
        const auto two = make_extractor(ExtractorKind::Reflective)->extract(SourceSpec{spec.header, {"Ledger", "Catalog"}, {dir}});
        t.expect(two.size() == 2 && two[0].interface_name == "Ledger" && two[1].interface_name == "Catalog", "request order");
    }

    {
        bool threw = false;
        try {
            (void)make_extractor(ExtractorKind::Reflective)->extract(SourceSpec{spec.header, {"Missing"}, {dir}});
        } catch (const ExtractionError &) {
            threw = true;
        }
        t.expect(threw, "unknown interface is an extraction error");
    }

    fs::remove_all(dir, ec);

    if (t.failures != 0) {
        std::cerr << t.failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
