#include "render_matchers.hpp"
#include "type_ref.hpp"

#include <iostream>
#include <set>
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

int main() {
    Run t;

    const TypeRef widget = named_type("Widget", "shop", "shop/widget.h");

    // Spelling
    {
        t.expect(render_type(named_type("int")) == "int", "builtin spelled bare");
        t.expect(render_type(widget) == "::shop::Widget", "project type fully qualified");
        t.expect(render_type(widget, RenderContext{"shop", ""}) == "Widget", "type in the output namespace spelled unqualified");
        t.expect(render_type(widget, RenderContext{"shop_test", "shop"}) == "Widget", "type in the self namespace spelled unqualified");

        TypeRef const_widget  = widget;
        const_widget.is_const = true;
        t.expect(render_type(wrap(TypeKind::LValueRef, const_widget)) == "const ::shop::Widget &", "const reference");
        TypeRef const_ptr  = wrap(TypeKind::Pointer, widget);
        const_ptr.is_const = true;
        t.expect(render_type(const_ptr) == "::shop::Widget *const", "const pointer");

        TypeRef variadic     = wrap(TypeKind::Slice, named_type("int"));
        variadic.is_variadic = true;
        t.expect(render_type(variadic) == "::std::initializer_list<int>", "variadic spelled as initializer_list");
        t.expect(render_type(decay(variadic)) == "::std::vector<int>", "variadic stored as vector");

        TypeRef fn;
        fn.kind = TypeKind::Function;
        fn.args.push_back(named_type("string", "std"));
        fn.results.push_back(named_type("bool"));
        t.expect(render_type(fn) == "::std::function<bool(::std::string)>", "function spelling");
    }

    // Identity and builtin classification
    {
        t.expect(identity_key(wrap(TypeKind::LValueRef, widget)) == identity_key(widget), "references decay for identity");
        t.expect(is_builtin(named_type("unsigned long")), "fundamental is builtin");
        t.expect(is_builtin(named_type("string", "std")), "std::string is builtin");
        t.expect(is_builtin(named_type("size_t", "std")), "std::size_t is builtin");
        t.expect(is_builtin(wrap(TypeKind::Slice, named_type("int"))), "vector<int> is builtin");
        t.expect(!is_builtin(wrap(TypeKind::Slice, widget)), "vector<Widget> is not builtin");
        t.expect(!is_builtin(widget), "project type is not builtin");
        t.expect(!is_builtin(named_type("error_code", "std")), "std::error_code gets matchers");
    }

    // Fundamental normalization
    {
        t.expect(normalize_fundamental({"unsigned", "long", "int"}) == std::optional<std::string>("unsigned long"), "unsigned long int");
        t.expect(normalize_fundamental({"long", "long"}) == std::optional<std::string>("long long"), "long long");
        t.expect(normalize_fundamental({"signed"}) == std::optional<std::string>("int"), "signed");
        t.expect(normalize_fundamental({"long", "double"}) == std::optional<std::string>("long double"), "long double");
        t.expect(normalize_fundamental({"unsigned", "char"}) == std::optional<std::string>("unsigned char"), "unsigned char");
        t.expect(!normalize_fundamental({"short", "double"}), "short double is rejected");
        t.expect(!normalize_fundamental({"Widget"}), "non-keyword is rejected");
    }

    // Standard templates map onto dedicated kinds
    {
        const TypeRef list = std_template_type("std", "initializer_list", {named_type("int")});
        t.expect(list.kind == TypeKind::Slice && list.is_variadic, "initializer_list is a variadic slice");
        const TypeRef array = std_template_type("std", "array", {named_type("int"), named_type("4")});
        t.expect(array.kind == TypeKind::Array && array.array_length == 4, "array keeps its length");
        const TypeRef map = std_template_type("std", "unordered_map", {named_type("string", "std"), widget});
        t.expect(map.kind == TypeKind::Map && !map.ordered, "unordered_map");
        const TypeRef owner = std_template_type("std", "shared_ptr", {widget});
        t.expect(owner.kind == TypeKind::Owner && !owner.ordered, "shared_ptr");
        const TypeRef text = std_template_type("std", "basic_string", {named_type("char")});
        t.expect(text == named_type("string", "std"), "basic_string<char> is std::string");
        const TypeRef optional = std_template_type("std", "optional", {widget});
        t.expect(optional.kind == TypeKind::Template && render_type(optional) == "::std::optional<::shop::Widget>", "other templates stay templates");
    }

    // Includes
    {
        std::set<std::string> project;
        std::set<std::string> standard;
        collect_includes(std_template_type("std", "map", {named_type("string", "std"), wrap(TypeKind::Pointer, widget)}), project, standard);
        t.expect(project == std::set<std::string>{"shop/widget.h"}, "project header collected");
        t.expect(standard.count("<map>") == 1 && standard.count("<string>") == 1, "standard headers collected");
    }

    // Matcher naming
    {
        t.expect(matcher_stem(widget) == "ShopWidget", "stem includes the innermost namespace");
        t.expect(matcher_stem(wrap(TypeKind::Pointer, widget)) == "PtrToShopWidget", "pointer stem");
        t.expect(matcher_stem(wrap(TypeKind::Slice, widget)) == "SliceOfShopWidget", "slice stem");
        t.expect(matcher_stem(named_type("unsigned long")) == "UnsignedLong", "multi-word builtin stem");
        t.expect(snake_case("PtrToShopWidget") == "ptr_to_shop_widget", "snake case");
        t.expect(snake_case("HTTPServer") == "http_server", "acronyms stay together");
        t.expect(snake_case("ArrayOf4Int") == "array_of4_int", "digits attach to the preceding word");
    }

    if (t.failures != 0) {
        std::cerr << t.failures << " failure(s)\n";
        return 1;
    }
    return 0;
}
