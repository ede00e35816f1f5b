// diff_demo — generating a patch from two versions of a document
//
// Demonstrates:
//   - Object diffs: per-key add/remove and recursive edits
//   - Array diffs: the longest-common-subsequence add/remove script
//   - Replaying the generated patch to reach the new version
//
// Build: cmake --build build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/diff_demo

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

int main() {
    const auto before = json::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs", "Bread"],
        "config": {"theme": "dark", "lang": "en"}
    })");
    const auto after = json::parse(R"({
        "title": "Groceries",
        "items": ["Milk", "Bread", "Eggs", "Butter"],
        "config": {"theme": "dark", "font/size": 14}
    })");

    const auto patch = jp::Patch{jp::diff(before, after)};
    std::printf("%zu operations:\n%s\n", patch.size(), patch.to_json().dump(2).c_str());

    const auto replayed = patch.apply(before);
    std::printf("replay matches: %s\n", replayed == after ? "yes" : "no");

    // An empty patch for identical documents.
    std::printf("identical documents: %s\n", jp::diff(after, after).dump().c_str());

    return replayed == after ? 0 : 1;
}
