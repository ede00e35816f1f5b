/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing and path-addressed document edits.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// Escape a reference token for RFC 6901: ~ -> ~0, / -> ~1.
auto escape_token(std::string_view token) -> std::string;

/// Parse a reference token as an array index.
/// Leading zeros are rejected except for "0" itself; "-" is not an index.
auto parse_index(std::string_view token) -> std::optional<std::size_t>;

/// A parsed JSON Pointer.
///
/// The empty pointer addresses the document root. Every other pointer is a
/// sequence of unescaped reference tokens, each naming an object key or an
/// array index (or "-", one past the last element).
///
/// The resolver members never modify their input in place: add, replace
/// and remove take the document by value and return the edited document.
/// Move a document in to avoid the copy.
///
/// @code
/// auto doc = nlohmann::json::parse(R"({"a": [1, 2]})");
/// auto ptr = Pointer{"/a/-"};
/// doc = ptr.add(std::move(doc), 3);   // {"a": [1, 2, 3]}
/// @endcode
class Pointer {
public:
    /// Construct the root pointer.
    Pointer() = default;

    /// Parse pointer text.
    /// @throws PatchError (invalid_pointer) if the text is not a valid pointer.
    explicit Pointer(std::string_view text);

    /// Build a pointer from already unescaped tokens.
    static auto from_tokens(std::vector<std::string> tokens) -> Pointer;

    // -- Structure ------------------------------------------------------------

    auto is_root() const noexcept -> bool { return tokens_.empty(); }
    auto tokens() const noexcept -> const std::vector<std::string>& { return tokens_; }

    /// The last reference token. Must not be called on the root pointer.
    auto back() const -> const std::string& { return tokens_.back(); }

    /// The pointer to the containing location. The root's parent is the root.
    auto parent() const -> Pointer;

    /// Append an object key (unescaped) or an array index.
    auto operator/(std::string_view token) const -> Pointer;
    auto operator/(std::size_t index) const -> Pointer;

    /// True if this pointer addresses a strict ancestor of @p other,
    /// comparing whole reference tokens.
    auto is_proper_prefix_of(const Pointer& other) const -> bool;

    /// The escaped pointer text ("" for the root).
    auto to_string() const -> std::string;

    auto operator==(const Pointer&) const -> bool = default;

    // -- Resolution -----------------------------------------------------------

    /// The value at this location.
    /// @throws PatchError (non_existent_path) if nothing is there.
    auto get(const nlohmann::json& doc) const -> const nlohmann::json&;

    /// True if get() would succeed.
    auto contains(const nlohmann::json& doc) const -> bool;

    /// Insert @p value. Objects gain or overwrite the key; arrays insert at
    /// the index (shifting later elements) or append on "-". At the root the
    /// value becomes the whole document.
    /// @throws PatchError (non_existent_path) if the parent does not exist
    ///   or the index is past the end.
    auto add(nlohmann::json doc, nlohmann::json value) const -> nlohmann::json;

    /// Overwrite the existing value at this location.
    /// @throws PatchError (non_existent_path) if nothing is there.
    auto replace(nlohmann::json doc, nlohmann::json value) const -> nlohmann::json;

    /// Delete the value at this location.
    /// @throws PatchError (non_existent_path) if nothing is there or this is
    ///   the root pointer.
    auto remove(nlohmann::json doc) const -> nlohmann::json;

private:
    std::vector<std::string> tokens_;
};

// -- ADL serialization --------------------------------------------------------

void to_json(nlohmann::json& j, const Pointer& p);
void from_json(const nlohmann::json& j, Pointer& p);

}  // namespace jsonpatch_cpp
