// basic_usage — demonstrates the core jsonpatch-cpp API
//
// Shows applying a literal patch document, building one fluently,
// inspecting typed operations, and handling a failed test operation.
// Library records are routed to the console through plog.
//
// Build: cmake --build build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>
#include <jsonpatch-cpp/log.hpp>

#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>

#include <cstdio>
#include <string>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

int main() {
    static auto appender = plog::ConsoleAppender<plog::TxtFormatter>{};
    plog::init<jp::log_instance>(plog::debug, &appender);

    const auto contacts = json::parse(R"({
        "John": {"phones": {"home": "555-0100"}, "age": 41},
        "Amy": {"phones": {}, "age": 29, "tags": ["friend"]}
    })");

    // -- A literal patch document ---------------------------------------------
    auto patch = jp::Patch::parse(R"([
        {"op": "test", "path": "/John/age", "value": 41},
        {"op": "replace", "path": "/John/age", "value": 42},
        {"op": "add", "path": "/Amy/tags/-", "value": "colleague"},
        {"op": "move", "from": "/John/phones/home", "path": "/John/phones/mobile"}
    ])");
    auto updated = patch.apply(contacts);
    std::printf("patched:\n%s\n", updated.dump(2).c_str());

    // -- The same kind of edit, built fluently --------------------------------
    auto built = jp::PatchBuilder{}
        .add("/John/phones/office", "1234-567")
        .remove("/Amy/age")
        .copy("/Amy/phones", "/John/phones");
    std::printf("builder produced %zu operations: %s\n",
                built.size(), built.build().dump().c_str());

    for (const auto& op : built.to_patch().operations()) {
        std::printf("  %-7s %s\n",
                    std::string{jp::to_string_view(jp::kind_of(op))}.c_str(),
                    jp::path_of(op).to_string().c_str());
    }

    // -- Failures leave the input untouched ------------------------------------
    try {
        (void)jp::PatchBuilder{}.remove("/Amy/age").test("/Amy/age", 29).apply(contacts);
    } catch (const jp::PatchError& e) {
        std::printf("failed (%s): %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }
    std::printf("original Amy age still %d\n", contacts["Amy"]["age"].get<int>());

    return 0;
}
