// Fuzz target for Patch::apply — the input is split at the first newline
// into a document and a patch. Any failure must surface as a PatchError.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    auto doc = nlohmann::json::parse(input.substr(0, split), nullptr, false);
    if (doc.is_discarded()) return 0;

    try {
        auto patch = jsonpatch_cpp::Patch::parse(input.substr(split + 1));
        auto strict = patch.apply(doc);
        (void)strict;
        auto textual = patch.apply(doc, {jsonpatch_cpp::MoveCheck::textual});
        (void)textual;
    } catch (const jsonpatch_cpp::PatchError&) {
        return 0;
    }
    return 0;
}
