// basic_usage: demonstrates the core jsonpatch-cpp API
//
// Shows patching a parsed document in place, the text-in/text-out entry
// point with indented output, lenient paths, negative indices, a custom
// operation, and how failures are reported.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace jp = jsonpatch_cpp;

namespace {

// "increment": add an integer to the number at path.
class IncrementExtension : public jp::Extension {
public:
    auto name() const -> std::string_view override { return "increment"; }

    void check(const jp::Operation& op) const override {
        if (!op.value || !op.value->is_number_integer()) {
            throw jp::Exception{jp::ErrorKind::missing_required_field,
                                "operation increment must contain an integer value"};
        }
    }

    void apply(const jp::Patch& patch, jp::Value& document,
               const jp::Operation& op) const override {
        auto found = patch.visit_path(document, jp::Pointer{*op.path}.segments());
        found.setter(jp::Value(found.node->get<std::int64_t>() + op.value->get<std::int64_t>()));
    }
};

}  // namespace

int main() {
    // -- In place: the document is a parsed nlohmann::json --------------------
    auto doc = jp::Value::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs"]
    })");

    jp::Patch{}.apply(doc, jp::parse_operations(R"([
        {"op": "add",     "path": "/items/-",  "value": "Bread"},
        {"op": "add",     "path": "/items/0",  "value": "Coffee"},
        {"op": "replace", "path": "/title",    "value": "Groceries"},
        {"op": "copy",    "from": "/items/1",  "path": "/favourite"},
        {"op": "test",    "path": "/favourite", "value": "Milk"}
    ])"));
    std::printf("In place:  %s\n", doc.dump().c_str());

    // -- Text in, text out ----------------------------------------------------
    const auto pretty = jp::Patch{jp::PatchOptions{
        .output = jp::OutputFormat{.indent = "  "},
    }};
    auto text = pretty.apply(R"({"config": {"theme": "dark"}})",
                             R"([{"op": "move", "from": "/config/theme", "path": "/theme"}])");
    std::printf("Indented:\n%s", text.c_str());

    // -- Lenient paths and negative indices -----------------------------------
    const auto lenient = jp::Patch{jp::PatchOptions{
        .strict_path_exists = false,
        .support_negative_array_index = true,
    }};
    text = lenient.apply(R"({"log": [1, 2, 3]})", R"([
        {"op": "remove", "path": "/missing"},
        {"op": "remove", "path": "/log/-1"}
    ])");
    std::printf("Lenient:   %s", text.c_str());

    // -- A custom operation ---------------------------------------------------
    const auto counting = jp::Patch{jp::PatchOptions{
        .extensions = {std::make_shared<IncrementExtension>()},
    }};
    text = counting.apply(R"({"visits": 41})",
                          R"([{"op": "increment", "path": "/visits", "value": 1}])");
    std::printf("Extension: %s", text.c_str());

    // -- Failures -------------------------------------------------------------
    try {
        jp::Patch{}.apply(R"({"version": 1})",
                          R"([{"op": "test", "path": "/version", "value": 2}])");
    } catch (const jp::Exception& e) {
        std::printf("Stopped:   [%s] %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }

    try {
        jp::Patch{}.apply(R"({"a": 1})", R"([{"op": "remove", "path": "/b"}])");
    } catch (const jp::Exception& e) {
        std::printf("Failed:    [%s] %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }

    return 0;
}
