// Fuzz target for Pointer: segment splitting and escaping must be total,
// and re-escaping the segments must reproduce them.

#include <jsonpatch-cpp/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string(reinterpret_cast<const char*>(data), size);
    const auto pointer = jsonpatch_cpp::Pointer{text};

    const auto segments = pointer.segments();
    const auto rebuilt = jsonpatch_cpp::Pointer::from_segments(segments);
    if (rebuilt.segments() != segments) std::abort();

    for (const auto& segment : segments) {
        if (jsonpatch_cpp::Pointer::unescape(jsonpatch_cpp::Pointer::escape(segment)) != segment) {
            std::abort();
        }
    }
    return 0;
}
