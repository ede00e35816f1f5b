// Fuzz target for diff — two documents separated by a newline must
// round-trip through the generated patch.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    auto source = nlohmann::json::parse(input.substr(0, split), nullptr, false);
    auto target = nlohmann::json::parse(input.substr(split + 1), nullptr, false);
    if (source.is_discarded() || target.is_discarded()) return 0;

    auto patch = jsonpatch_cpp::Patch{jsonpatch_cpp::diff(source, target)};
    if (patch.apply(source) != target) std::abort();
    return 0;
}
