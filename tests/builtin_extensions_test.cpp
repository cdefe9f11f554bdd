// builtin_extensions_test.cpp -- semantics of the six RFC 6902 operations.

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace jsonpatch_cpp;

namespace {

auto lenient() -> Patch {
    return Patch{PatchOptions{.strict_path_exists = false}};
}

// Apply @p patch_text to @p doc_text in place and return the document.
auto patched(const Patch& patch, std::string_view doc_text, std::string_view patch_text) -> Value {
    auto doc = Value::parse(doc_text);
    patch.apply(doc, parse_operations(patch_text));
    return doc;
}

auto patched(std::string_view doc_text, std::string_view patch_text) -> Value {
    return patched(Patch{}, doc_text, patch_text);
}

// Apply and capture the resulting exception.
auto failure(const Patch& patch, Value& doc, std::string_view patch_text) -> Exception {
    try {
        patch.apply(doc, parse_operations(patch_text));
    } catch (const Exception& e) {
        return e;
    }
    ADD_FAILURE() << "expected an Exception";
    return Exception{ErrorKind::invalid_document, "no failure"};
}

}  // namespace

// =============================================================================
// add
// =============================================================================

TEST(AddOperation, null_value_is_added) {
    EXPECT_EQ(patched("{}", R"([{"op": "add", "path": "/foo", "value": null}])"),
              Value::parse(R"({"foo": null})"));
}

TEST(AddOperation, inserts_into_array) {
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})", R"([{"op": "add", "path": "/a/2", "value": 4}])"),
              Value::parse(R"({"a": [1, 2, 4, 3]})"));
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})", R"([{"op": "add", "path": "/a/3", "value": 4}])"),
              Value::parse(R"({"a": [1, 2, 3, 4]})"));
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})", R"([{"op": "add", "path": "/a/-", "value": 4}])"),
              Value::parse(R"({"a": [1, 2, 3, 4]})"));
}

TEST(AddOperation, whole_document_is_replaced) {
    EXPECT_EQ(patched(R"({"a": 1})", R"([{"op": "add", "path": "", "value": [true]}])"),
              Value::parse("[true]"));
}

TEST(AddOperation, empty_key_member) {
    EXPECT_EQ(patched("{}", R"([{"op": "add", "path": "/", "value": 1}])"),
              Value::parse(R"({"": 1})"));
}

TEST(AddOperation, escaped_key) {
    EXPECT_EQ(patched("{}", R"([{"op": "add", "path": "/a~1b~0c", "value": 1}])"),
              Value::parse(R"({"a/b~c": 1})"));
}

TEST(AddOperation, missing_parent_strict) {
    auto doc = Value::parse(R"({"a": 1})");
    const auto e = failure(Patch{}, doc, R"([{"op": "add", "path": "/x/y", "value": 1}])");
    EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    EXPECT_EQ(std::string{e.what()},
              "operation failed: add /x/y ext=add, "
              "err=cannot resolve /x/y: path member not exists: x");
}

TEST(AddOperation, missing_parent_lenient_is_skipped) {
    EXPECT_EQ(patched(lenient(), R"({"a": 1})",
                      R"([{"op": "add", "path": "/x/y", "value": 1},
                          {"op": "add", "path": "/b", "value": 2}])"),
              Value::parse(R"({"a": 1, "b": 2})"));
}

TEST(AddOperation, index_out_of_range_is_not_skipped) {
    auto doc = Value::parse(R"({"a": [1]})");
    const auto e = failure(lenient(), doc, R"([{"op": "add", "path": "/a/5", "value": 1}])");
    EXPECT_EQ(e.kind(), ErrorKind::index_out_of_range);
}

TEST(AddOperation, into_scalar_is_type_mismatch) {
    auto doc = Value::parse(R"({"a": 1})");
    const auto e = failure(Patch{}, doc, R"([{"op": "add", "path": "/a/b", "value": 1}])");
    EXPECT_EQ(e.kind(), ErrorKind::type_mismatch);
}

TEST(AddOperation, value_is_required) {
    auto doc = Value::parse("{}");
    const auto e = failure(Patch{}, doc, R"([{"op": "add", "path": "/a"}])");
    EXPECT_EQ(e.kind(), ErrorKind::missing_required_field);
    EXPECT_EQ(std::string{e.what()},
              R"(operation add must contain a value member: {"op":"add","path":"/a"})");
}

// =============================================================================
// remove
// =============================================================================

TEST(RemoveOperation, removes_member) {
    EXPECT_EQ(patched(R"({"foo": 1})", R"([{"op": "remove", "path": "/foo"}])"), Value::object());
}

TEST(RemoveOperation, removes_array_element) {
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})", R"([{"op": "remove", "path": "/a/0"}])"),
              Value::parse(R"({"a": [2, 3]})"));
}

TEST(RemoveOperation, missing_member) {
    auto doc = Value::parse(R"({"a": 1})");
    EXPECT_EQ(failure(Patch{}, doc, R"([{"op": "remove", "path": "/b"}])").kind(),
              ErrorKind::path_not_found);
    EXPECT_EQ(patched(lenient(), R"({"a": 1})", R"([{"op": "remove", "path": "/b"}])"),
              Value::parse(R"({"a": 1})"));
}

TEST(RemoveOperation, ignores_value_member) {
    EXPECT_EQ(patched(R"({"a": 1})", R"([{"op": "remove", "path": "/a", "value": 5}])"),
              Value::object());
}

// =============================================================================
// replace
// =============================================================================

TEST(ReplaceOperation, replaces_member) {
    EXPECT_EQ(patched(R"({"a": 1, "b": 2})", R"([{"op": "replace", "path": "/a", "value": [1]}])"),
              Value::parse(R"({"a": [1], "b": 2})"));
}

TEST(ReplaceOperation, replaces_array_element) {
    EXPECT_EQ(patched("[1, 2]", R"([{"op": "replace", "path": "/1", "value": 3}])"),
              Value::parse("[1, 3]"));
}

TEST(ReplaceOperation, whole_document) {
    EXPECT_EQ(patched(R"({"a": 1})", R"([{"op": "replace", "path": "", "value": {"b": 2}}])"),
              Value::parse(R"({"b": 2})"));
}

TEST(ReplaceOperation, missing_member_strict) {
    auto doc = Value::parse(R"({"a": 1})");
    EXPECT_EQ(failure(Patch{}, doc, R"([{"op": "replace", "path": "/b", "value": 1}])").kind(),
              ErrorKind::path_not_found);
    EXPECT_EQ(doc, Value::parse(R"({"a": 1})"));
}

TEST(ReplaceOperation, append_slot_lenient_is_a_no_op) {
    EXPECT_EQ(patched(lenient(), "[1]", R"([{"op": "replace", "path": "/-", "value": 2}])"),
              Value::parse("[1]"));
}

// =============================================================================
// move
// =============================================================================

TEST(MoveOperation, renames_within_object) {
    EXPECT_EQ(patched(R"({"a": 1})", R"([{"op": "move", "from": "/a", "path": "/b"}])"),
              Value::parse(R"({"b": 1})"));
}

TEST(MoveOperation, across_parents) {
    EXPECT_EQ(patched(R"({"a": {"b": [1, 2]}, "c": {}})",
                      R"([{"op": "move", "from": "/a/b", "path": "/c/d"}])"),
              Value::parse(R"({"a": {}, "c": {"d": [1, 2]}})"));
}

TEST(MoveOperation, array_element_out_of_array) {
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})", R"([{"op": "move", "from": "/a/0", "path": "/b"}])"),
              Value::parse(R"({"a": [2, 3], "b": 1})"));
}

TEST(MoveOperation, within_array) {
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})",
                      R"([{"op": "move", "from": "/a/0", "path": "/a/2"}])"),
              Value::parse(R"({"a": [2, 3, 1]})"));
    EXPECT_EQ(patched(R"({"a": [1, 2, 3]})",
                      R"([{"op": "move", "from": "/a/2", "path": "/a/0"}])"),
              Value::parse(R"({"a": [3, 1, 2]})"));
}

TEST(MoveOperation, onto_itself_is_a_no_op) {
    EXPECT_EQ(patched(R"({"a": {"b": 1}})", R"([{"op": "move", "from": "/a/b", "path": "/a/b"}])"),
              Value::parse(R"({"a": {"b": 1}})"));
}

TEST(MoveOperation, absent_source_strict) {
    auto doc = Value::parse(R"({"x": 1})");
    const auto e = failure(Patch{}, doc, R"([{"op": "move", "from": "/a", "path": "/b"}])");
    EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    EXPECT_EQ(std::string{e.what()},
              "operation failed: move /a to /b ext=move, "
              "err=cannot resolve /a: path member not exists: a");
}

TEST(MoveOperation, absent_source_lenient_is_a_no_op) {
    EXPECT_EQ(patched(lenient(), R"({"x": 1})", R"([{"op": "move", "from": "/a", "path": "/b"}])"),
              Value::parse(R"({"x": 1})"));
    EXPECT_EQ(patched(lenient(), R"({"x": [1]})",
                      R"([{"op": "move", "from": "/x/4", "path": "/y"}])"),
              Value::parse(R"({"x": [1]})"));
}

TEST(MoveOperation, from_is_required) {
    auto doc = Value::parse("{}");
    const auto e = failure(Patch{}, doc, R"([{"op": "move", "path": "/a"}])");
    EXPECT_EQ(e.kind(), ErrorKind::missing_required_field);
}

// =============================================================================
// copy
// =============================================================================

TEST(CopyOperation, copies_member) {
    EXPECT_EQ(patched(R"({"a": {"b": 1}})", R"([{"op": "copy", "from": "/a", "path": "/c"}])"),
              Value::parse(R"({"a": {"b": 1}, "c": {"b": 1}})"));
}

TEST(CopyOperation, copies_into_array) {
    EXPECT_EQ(patched(R"({"a": [1, 2]})", R"([{"op": "copy", "from": "/a/1", "path": "/a/0"}])"),
              Value::parse(R"({"a": [2, 1, 2]})"));
}

TEST(CopyOperation, copy_does_not_alias_source) {
    const auto doc = patched(R"({"a": {"b": [1, {"c": 2}]}})",
                             R"([{"op": "copy", "from": "/a", "path": "/d"},
                                 {"op": "add", "path": "/d/b/1/e", "value": 3},
                                 {"op": "remove", "path": "/d/b/0"}])");
    EXPECT_EQ(doc, Value::parse(R"({"a": {"b": [1, {"c": 2}]}, "d": {"b": [{"c": 2, "e": 3}]}})"));
}

TEST(CopyOperation, missing_source) {
    auto doc = Value::parse(R"({"a": 1})");
    const auto e = failure(Patch{}, doc, R"([{"op": "copy", "from": "/x", "path": "/b"}])");
    EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    EXPECT_EQ(std::string{e.what()},
              "operation failed: copy /b from /x ext=copy, "
              "err=cannot resolve /x: path member not exists: x");
}

// =============================================================================
// test
// =============================================================================

TEST(TestOperation, matching_value_passes) {
    EXPECT_EQ(patched(R"({"a": {"b": [1, 2]}})",
                      R"([{"op": "test", "path": "/a", "value": {"b": [1, 2]}}])"),
              Value::parse(R"({"a": {"b": [1, 2]}})"));
}

TEST(TestOperation, integer_and_float_compare_equal) {
    EXPECT_NO_THROW(patched(R"({"a": 1})", R"([{"op": "test", "path": "/a", "value": 1.0}])"));
}

TEST(TestOperation, null_value_is_compared) {
    EXPECT_NO_THROW(patched(R"({"a": null})", R"([{"op": "test", "path": "/a", "value": null}])"));
}

TEST(TestOperation, whole_document) {
    EXPECT_NO_THROW(patched("[1]", R"([{"op": "test", "path": "", "value": [1]}])"));
}

TEST(TestOperation, mismatch_stops_the_patch) {
    auto doc = Value::parse(R"({"a": 1})");
    const auto e = failure(Patch{}, doc, R"([{"op": "test", "path": "/a", "value": 2},
                                             {"op": "add", "path": "/b", "value": 1}])");
    EXPECT_EQ(e.kind(), ErrorKind::abort_signal);
    EXPECT_EQ(std::string{e.what()},
              "operation stopped: test /a ext=test, err=test: value at /a is 1, expected 2");
    EXPECT_EQ(doc, Value::parse(R"({"a": 1})"));
}

TEST(TestOperation, missing_path_strict_is_path_not_found) {
    auto doc = Value::parse(R"({"a": 1})");
    const auto e = failure(Patch{}, doc, R"([{"op": "test", "path": "/b", "value": 1}])");
    EXPECT_EQ(e.kind(), ErrorKind::path_not_found);
    EXPECT_EQ(std::string{e.what()}.rfind("operation failed: test /b ext=test, ", 0), 0u);
}

TEST(TestOperation, missing_path_lenient_stops_the_patch) {
    auto doc = Value::parse(R"({"a": 1})");
    const auto e = failure(lenient(), doc, R"([{"op": "test", "path": "/b", "value": 1}])");
    EXPECT_EQ(e.kind(), ErrorKind::abort_signal);
    EXPECT_EQ(std::string{e.what()}.rfind("operation stopped: ", 0), 0u);
}

TEST(TestOperation, never_mutates) {
    for (const auto* value : {"1", "2", "null", R"({"x": 1})"}) {
        auto doc = Value::parse(R"({"a": 1, "b": [1, 2]})");
        const auto before = doc;
        const auto text = std::string{R"([{"op": "test", "path": "/a", "value": )"} + value + "}]";
        try {
            Patch{}.apply(doc, parse_operations(text));
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::abort_signal);
        }
        EXPECT_EQ(doc, before) << "value " << value;
    }
}

TEST(TestOperation, value_is_required) {
    auto doc = Value::parse(R"({"a": 1})");
    EXPECT_EQ(failure(Patch{}, doc, R"([{"op": "test", "path": "/a"}])").kind(),
              ErrorKind::missing_required_field);
}
