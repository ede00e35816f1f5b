#include <jsonpatch-cpp/diff.hpp>

#include <jsonpatch-cpp/builder.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace jsonpatch_cpp {

namespace {

/// Longest-common-subsequence lengths for a source/target array pair.
///
/// Each cell holds (length << 1) | matched, where matched is set when the
/// cell was reached by a diagonal step over two equal elements. Keeping the
/// flag avoids comparing the elements again while backtracking.
class LcsTable {
public:
    LcsTable(const nlohmann::json& source, const nlohmann::json& target)
        : rows_{source.size() + 1}, cols_{target.size() + 1}, cells_(rows_ * cols_, 0) {
        for (std::size_t i = 0; i < source.size(); ++i) {
            for (std::size_t j = 0; j < target.size(); ++j) {
                if (source[i] == target[j]) {
                    at(i + 1, j + 1) = (at(i, j) & ~std::size_t{1}) + 3;
                } else {
                    at(i + 1, j + 1) = std::max(at(i + 1, j), at(i, j + 1)) & ~std::size_t{1};
                }
            }
        }
    }

    auto at(std::size_t i, std::size_t j) const -> std::size_t { return cells_[i * cols_ + j]; }
    auto matched(std::size_t i, std::size_t j) const -> bool { return (at(i, j) & 1) != 0; }

private:
    auto at(std::size_t i, std::size_t j) -> std::size_t& { return cells_[i * cols_ + j]; }

    std::size_t rows_;
    std::size_t cols_;
    std::vector<std::size_t> cells_;
};

/// State for a single diff() call.
class DiffGenerator {
public:
    auto run(const nlohmann::json& source, const nlohmann::json& target) -> nlohmann::json {
        diff_value(Pointer{}, source, target);
        return builder_.build();
    }

private:
    void diff_value(const Pointer& path, const nlohmann::json& source,
                    const nlohmann::json& target) {
        if (source == target) return;
        if (source.is_object() && target.is_object()) {
            diff_object(path, source, target);
        } else if (source.is_array() && target.is_array()) {
            diff_array(path, source, target);
        } else {
            builder_.replace(path, target);
        }
    }

    void diff_object(const Pointer& path, const nlohmann::json& source,
                     const nlohmann::json& target) {
        for (auto it = source.begin(); it != source.end(); ++it) {
            auto found = target.find(it.key());
            if (found != target.end()) {
                diff_value(path / it.key(), it.value(), *found);
            } else {
                builder_.remove(path / it.key());
            }
        }
        for (auto it = target.begin(); it != target.end(); ++it) {
            if (!source.contains(it.key())) {
                builder_.add(path / it.key(), it.value());
            }
        }
    }

    // Only add and remove are generated for arrays. Walking back from the
    // tails, the array being patched always reads source[0, i) followed by
    // target[j, n), so an add lands at index i and a remove at index i - 1.
    void diff_array(const Pointer& path, const nlohmann::json& source,
                    const nlohmann::json& target) {
        PLOGV_(log_instance) << "diff array '" << path.to_string() << "' "
                             << source.size() << "x" << target.size();
        const auto c = LcsTable{source, target};
        auto i = source.size();
        auto j = target.size();
        while (i > 0 || j > 0) {
            if (i > 0 && j > 0 && c.matched(i, j)) {
                --i;
                --j;
            } else if (j > 0 && (i == 0 || c.at(i, j - 1) >= c.at(i - 1, j))) {
                builder_.add(path / i, target[j - 1]);
                --j;
            } else {
                builder_.remove(path / (i - 1));
                --i;
            }
        }
    }

    PatchBuilder builder_;
};

}  // anonymous namespace

auto diff(const nlohmann::json& source, const nlohmann::json& target) -> nlohmann::json {
    return DiffGenerator{}.run(source, target);
}

}  // namespace jsonpatch_cpp
