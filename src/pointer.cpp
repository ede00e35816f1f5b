#include <jsonpatch-cpp/pointer.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

namespace {

[[noreturn]] void throw_invalid(std::string_view text, std::string_view reason) {
    throw PatchError{ErrorKind::invalid_pointer,
        "Invalid JSON Pointer '" + std::string{text} + "': " + std::string{reason}};
}

[[noreturn]] void throw_missing(const Pointer& ptr) {
    throw PatchError{ErrorKind::non_existent_path,
        "The JSON Pointer '" + ptr.to_string() + "' references a nonexistent value"};
}

/// Unescape one reference token: ~1 -> /, ~0 -> ~.
auto unescape_token(std::string_view text, std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            result.push_back(token[i]);
            continue;
        }
        if (i + 1 == token.size()) throw_invalid(text, "'~' at end of token");
        switch (token[++i]) {
            case '0': result.push_back('~'); break;
            case '1': result.push_back('/'); break;
            default:  throw_invalid(text, "'~' must be followed by '0' or '1'");
        }
    }
    return result;
}

/// Step from @p node into the child named by @p token, or nullptr.
/// Works for both const and mutable documents.
template <typename Json>
auto child_of(Json& node, const std::string& token) -> Json* {
    if (node.is_object()) {
        auto it = node.find(token);
        if (it == node.end()) return nullptr;
        return &*it;
    }
    if (node.is_array()) {
        auto idx = parse_index(token);
        if (!idx || *idx >= node.size()) return nullptr;
        return &node[*idx];
    }
    return nullptr;
}

/// Walk the first @p depth tokens of @p ptr.
template <typename Json>
auto walk(Json& doc, const Pointer& ptr, std::size_t depth) -> Json* {
    auto* node = &doc;
    const auto& tokens = ptr.tokens();
    for (std::size_t i = 0; i < depth && node; ++i) {
        node = child_of(*node, tokens[i]);
    }
    return node;
}

}  // anonymous namespace

auto escape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto parse_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

// =============================================================================
// Pointer structure
// =============================================================================

Pointer::Pointer(std::string_view text) {
    if (text.empty()) return;
    if (text[0] != '/') throw_invalid(text, "must be empty or start with '/'");
    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        tokens_.push_back(unescape_token(text, text.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
}

auto Pointer::from_tokens(std::vector<std::string> tokens) -> Pointer {
    auto p = Pointer{};
    p.tokens_ = std::move(tokens);
    return p;
}

auto Pointer::parent() const -> Pointer {
    if (is_root()) return *this;
    return from_tokens({tokens_.begin(), tokens_.end() - 1});
}

auto Pointer::operator/(std::string_view token) const -> Pointer {
    auto p = *this;
    p.tokens_.emplace_back(token);
    return p;
}

auto Pointer::operator/(std::size_t index) const -> Pointer {
    auto p = *this;
    p.tokens_.push_back(std::to_string(index));
    return p;
}

auto Pointer::is_proper_prefix_of(const Pointer& other) const -> bool {
    if (tokens_.size() >= other.tokens_.size()) return false;
    for (std::size_t i = 0; i < tokens_.size(); ++i) {
        if (tokens_[i] != other.tokens_[i]) return false;
    }
    return true;
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result.push_back('/');
        result += escape_token(token);
    }
    return result;
}

// =============================================================================
// Resolution
// =============================================================================

auto Pointer::get(const nlohmann::json& doc) const -> const nlohmann::json& {
    const auto* node = walk(doc, *this, tokens_.size());
    if (!node) throw_missing(*this);
    return *node;
}

auto Pointer::contains(const nlohmann::json& doc) const -> bool {
    return walk(doc, *this, tokens_.size()) != nullptr;
}

auto Pointer::add(nlohmann::json doc, nlohmann::json value) const -> nlohmann::json {
    if (is_root()) return value;

    auto* parent = walk(doc, *this, tokens_.size() - 1);
    if (!parent) throw_missing(*this);

    const auto& last = tokens_.back();
    if (parent->is_object()) {
        (*parent)[last] = std::move(value);
    } else if (parent->is_array()) {
        if (last == "-") {
            parent->push_back(std::move(value));
        } else {
            auto idx = parse_index(last);
            if (!idx || *idx > parent->size()) throw_missing(*this);
            parent->insert(parent->begin() + static_cast<std::ptrdiff_t>(*idx), std::move(value));
        }
    } else {
        throw_missing(*this);
    }
    return doc;
}

auto Pointer::replace(nlohmann::json doc, nlohmann::json value) const -> nlohmann::json {
    if (is_root()) return value;

    auto* node = walk(doc, *this, tokens_.size());
    if (!node) throw_missing(*this);
    *node = std::move(value);
    return doc;
}

auto Pointer::remove(nlohmann::json doc) const -> nlohmann::json {
    if (is_root()) {
        throw PatchError{ErrorKind::non_existent_path, "The document root cannot be removed"};
    }

    auto* parent = walk(doc, *this, tokens_.size() - 1);
    if (!parent) throw_missing(*this);

    const auto& last = tokens_.back();
    if (parent->is_object()) {
        if (parent->erase(last) == 0) throw_missing(*this);
    } else if (parent->is_array()) {
        auto idx = parse_index(last);
        if (!idx || *idx >= parent->size()) throw_missing(*this);
        parent->erase(static_cast<nlohmann::json::size_type>(*idx));
    } else {
        throw_missing(*this);
    }
    return doc;
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Pointer& p) {
    j = p.to_string();
}

void from_json(const nlohmann::json& j, Pointer& p) {
    if (!j.is_string()) {
        throw PatchError{ErrorKind::invalid_pointer, "A JSON Pointer must be a string"};
    }
    p = Pointer{j.get_ref<const std::string&>()};
}

}  // namespace jsonpatch_cpp
