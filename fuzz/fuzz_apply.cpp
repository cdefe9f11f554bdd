// Fuzz target for Patch::apply: the input is a document and a patch
// separated by a NUL byte. Every failure must surface as a
// jsonpatch_cpp::Exception, and the output of a successful patch must
// decode again.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    jsonpatch_cpp::log::set_level(jsonpatch_cpp::log::Level::off);

    // Both option sets exercise different branches of the mutators.
    const auto strict = jsonpatch_cpp::Patch{};
    const auto lenient = jsonpatch_cpp::Patch{jsonpatch_cpp::PatchOptions{
        .strict_path_exists = false,
        .support_negative_array_index = true,
    }};

    for (const auto* patch : {&strict, &lenient}) {
        try {
            const auto out = patch->apply(input.substr(0, split), input.substr(split + 1));
            if (!jsonpatch_cpp::Value::accept(out)) std::abort();
        } catch (const jsonpatch_cpp::Exception&) {
            // Rejected input.
        }
    }
    return 0;
}
