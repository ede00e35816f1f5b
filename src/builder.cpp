#include <jsonpatch-cpp/builder.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <string>
#include <utility>

namespace jsonpatch_cpp {

PatchBuilder::PatchBuilder() : operations_(nlohmann::json::array()) {}

PatchBuilder::PatchBuilder(nlohmann::json operations)
    : operations_(std::move(operations)) {
    if (!operations_.is_array()) {
        throw PatchError{ErrorKind::malformed_patch,
            "A JSON patch must be an array, got " + std::string{operations_.type_name()}};
    }
}

auto PatchBuilder::append(const Operation& op) -> PatchBuilder& {
    operations_.push_back(nlohmann::json(op));
    return *this;
}

// -- add / remove / replace ---------------------------------------------------

auto PatchBuilder::add(std::string_view path, nlohmann::json value) -> PatchBuilder& {
    return add(Pointer{path}, std::move(value));
}

auto PatchBuilder::add(Pointer path, nlohmann::json value) -> PatchBuilder& {
    return append(AddOp{std::move(path), std::move(value)});
}

auto PatchBuilder::remove(std::string_view path) -> PatchBuilder& {
    return remove(Pointer{path});
}

auto PatchBuilder::remove(Pointer path) -> PatchBuilder& {
    return append(RemoveOp{std::move(path)});
}

auto PatchBuilder::replace(std::string_view path, nlohmann::json value) -> PatchBuilder& {
    return replace(Pointer{path}, std::move(value));
}

auto PatchBuilder::replace(Pointer path, nlohmann::json value) -> PatchBuilder& {
    return append(ReplaceOp{std::move(path), std::move(value)});
}

// -- move / copy / test -------------------------------------------------------

auto PatchBuilder::move(std::string_view path, std::string_view from) -> PatchBuilder& {
    return move(Pointer{path}, Pointer{from});
}

auto PatchBuilder::move(Pointer path, Pointer from) -> PatchBuilder& {
    return append(MoveOp{std::move(from), std::move(path)});
}

auto PatchBuilder::copy(std::string_view path, std::string_view from) -> PatchBuilder& {
    return copy(Pointer{path}, Pointer{from});
}

auto PatchBuilder::copy(Pointer path, Pointer from) -> PatchBuilder& {
    return append(CopyOp{std::move(from), std::move(path)});
}

auto PatchBuilder::test(std::string_view path, nlohmann::json value) -> PatchBuilder& {
    return test(Pointer{path}, std::move(value));
}

auto PatchBuilder::test(Pointer path, nlohmann::json value) -> PatchBuilder& {
    return append(TestOp{std::move(path), std::move(value)});
}

// -- apply --------------------------------------------------------------------

auto PatchBuilder::apply(const nlohmann::json& target,
                         const ApplyOptions& options) const -> nlohmann::json {
    return to_patch().apply(target, options);
}

auto PatchBuilder::apply(const nlohmann::json::object_t& target,
                         const ApplyOptions& options) const -> nlohmann::json::object_t {
    return to_patch().apply(target, options);
}

auto PatchBuilder::apply(const nlohmann::json::array_t& target,
                         const ApplyOptions& options) const -> nlohmann::json::array_t {
    return to_patch().apply(target, options);
}

}  // namespace jsonpatch_cpp
