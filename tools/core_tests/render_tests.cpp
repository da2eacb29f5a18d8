#include "errors.hpp"
#include "render_matchers.hpp"
#include "render_mocks.hpp"
#include "type_ref.hpp"
#include "validate.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

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

bool contains(const std::string &text, std::string_view needle) { return text.find(needle) != std::string::npos; }

TypeRef const_ref(TypeRef inner) {
    inner.is_const = true;
    return wrap(TypeKind::LValueRef, std::move(inner));
}

// shop::Display: close(), draw(const Pixel &at, initializer_list<Pixel> more), lookup(std::string) -> (int, Pixel *)
InterfaceModel display_model() {
    const TypeRef pixel = named_type("Pixel", "shop", "shop/pixel.h");

    InterfaceModel model;
    model.interface_name = "Display";
    model.scope          = "shop";
    model.header         = "shop/display.h";

    MethodSignature close;
    close.name = "close";
    model.methods.push_back(close);

    MethodSignature draw;
    draw.name         = "draw";
    TypeRef more      = wrap(TypeKind::Slice, pixel);
    more.is_variadic  = true;
    draw.params       = {Parameter{"at", const_ref(pixel)}, Parameter{"more", more}};
    model.methods.push_back(draw);

    MethodSignature lookup;
    lookup.name      = "lookup";
    lookup.is_const  = true;
    lookup.params    = {Parameter{"key", named_type("string", "std")}};
    lookup.results   = {named_type("int"), wrap(TypeKind::Pointer, pixel)};
    lookup.aggregate = ResultAggregate::Tuple;
    model.methods.push_back(lookup);
    return model;
}

MockRenderOptions options_for(std::string ns) {
    MockRenderOptions options;
    options.namespace_name   = std::move(ns);
    options.destination_path = "/work/mocks/mock_display.h";
    options.include_dirs     = {"/work"};
    return options;
}

} // namespace

int main() {
    Run t;

    const InterfaceModel model = display_model();
    validate_model(model);

    // Layout of the rendered mock
    {
        const auto artifact = render_mock(model, options_for("shop_test"));
        const auto &text    = artifact.source_text;
        t.expect(text.rfind(kGeneratedMarker, 0) == 0, "first line is the generated-file marker");
        t.expect(contains(text, "// Source: shop/display.h (shop::Display)"), "source comment");
        t.expect(contains(text, "#include \"shop/display.h\"\n#include \"shop/pixel.h\"\n"), "project includes sorted");
        t.expect(contains(text, "#include <mockforge/mock.h>"), "runtime include");
        t.expect(contains(text, "#include <initializer_list>") && contains(text, "#include <tuple>") && contains(text, "#include <vector>"),
                 "standard includes for variadics and tuples");
        t.expect(contains(text, "namespace shop_test {"), "output namespace");
        t.expect(contains(text, "class MockDisplay final : public ::shop::Display {"), "mock derives from the interface");
        t.expect(contains(text, "void draw(const ::shop::Pixel &at, ::std::initializer_list<::shop::Pixel> more) override {"),
                 "override keeps parameter names");
        t.expect(contains(text, "mock_draw_.invoke(at, ::std::vector<::shop::Pixel>(more.begin(), more.end()));"),
                 "variadic forwarded as a vector");
        t.expect(contains(text, "::std::tuple<int, ::shop::Pixel *> lookup(::std::string key) const override {"), "tuple result and const");
        t.expect(contains(text, "return mock_lookup_.invoke(::std::move(key));"), "by-value arguments moved");
        t.expect(contains(text, "mutable ::mockforge::MethodMock<void(::shop::Pixel, ::std::vector<::shop::Pixel>)> mock_draw_{state_, \"shop::Display::draw\"};"),
                 "stored argument types decayed");
        t.expect(contains(text, "auto &mock_close() { return mock_close_; }"), "accessor per method");
        t.expect(artifact.referenced_types.size() == 3, "referenced parameter types collected once each, matchers requested or not");
    }

    // Determinism
    {
        const auto first  = render_mock(model, options_for("shop_test"));
        const auto second = render_mock(model, options_for("shop_test"));
        t.expect(first.source_text == second.source_text, "rendering is deterministic");
    }

    // Self namespace spells the interface's own types unqualified
    {
        auto options           = options_for("shop_test");
        options.self_namespace = "shop";
        const auto text        = render_mock(model, options).source_text;
        t.expect(contains(text, "class MockDisplay final : public Display {"), "base unqualified in the self namespace");
        t.expect(contains(text, "void draw(const Pixel &at"), "parameter types unqualified in the self namespace");
    }

    // A destination never includes itself
    {
        auto options             = options_for("shop");
        options.destination_path = "/work/shop/pixel.h";
        const auto text          = render_mock(model, options).source_text;
        t.expect(!contains(text, "#include \"shop/pixel.h\""), "destination excluded from includes");
    }

    // Types without a known header
    {
        InterfaceModel broken = model;
        broken.methods[0].params.push_back(Parameter{"g", named_type("Gadget", "tools")});
        bool threw = false;
        try {
            (void)render_mock(broken, options_for("shop_test"));
        } catch (const GenerationError &e) {
            threw = contains(e.what(), "tools::Gadget");
        }
        t.expect(threw, "project type without header is a generation error");

        auto options = options_for("tools");
        t.expect(contains(render_mock(broken, options).source_text, "Gadget g"), "type from the output namespace is accepted");
    }

    // Matchers: one header per distinct non-builtin type across artifacts
    {
        InterfaceModel other  = model;
        other.interface_name  = "Screen";
        const auto first      = render_mock(model, options_for("shop_test"));
        auto       other_opts = options_for("shop_test");
        other_opts.destination_path = "/work/mocks/mock_screen.h";
        const auto second     = render_mock(other, other_opts);

        MatcherRenderOptions matcher_options;
        matcher_options.directory    = "/work/mocks/matchers";
        matcher_options.include_dirs = {"/work"};
        const auto matchers          = render_matchers({first, second}, matcher_options);

        std::vector<std::string> files;
        for (const auto &m : matchers) {
            files.push_back(m.destination_path.filename().string());
        }
        t.expect(files == std::vector<std::string>{"shop_pixel.h", "slice_of_shop_pixel.h"}, "deduplicated, builtins skipped, sorted");
        if (!matchers.empty()) {
            const auto &text = matchers.front().source_text;
            t.expect(text.rfind(kGeneratedMarker, 0) == 0, "matcher header carries the marker");
            t.expect(contains(text, "#include \"shop/pixel.h\""), "matcher includes the type's header");
            t.expect(contains(text, "#include <mockforge/matchers.h>"), "matcher includes the runtime");
            t.expect(contains(text, "namespace matchers {"), "default matcher namespace");
            t.expect(contains(text, "inline ::mockforge::match::Typed<::shop::Pixel> AnyShopPixel()"), "Any matcher");
            t.expect(contains(text, "EqShopPixel(Value value)") && contains(text, "NotEqShopPixel(Value value)"), "Eq and NotEq matchers");
            t.expect(contains(text, "ShopPixelThat(::std::function<bool(const ::shop::Pixel &)> predicate)"), "predicate matcher");
        }
    }

    // Validation
    {
        InterfaceModel duplicate = model;
        duplicate.methods.push_back(duplicate.methods.front());
        bool threw = false;
        try {
            validate_model(duplicate);
        } catch (const ExtractionError &) {
            threw = true;
        }
        t.expect(threw, "duplicate method names rejected");

        InterfaceModel renamed                   = model;
        renamed.methods[1].params[0].name        = "where";
        t.expect(models_equivalent(model, renamed), "parameter names do not affect equivalence");
        renamed.methods[1].params[0].type        = named_type("int");
        t.expect(!models_equivalent(model, renamed), "parameter types do");
    }

    if (t.failures != 0) {
        std::cerr << t.failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
