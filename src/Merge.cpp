/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "strata/Merge.hpp"
#include "strata/ArrayOps.hpp"
#include "strata/Errors.hpp"
#include "strata/Knockout.hpp"

#include <string>
#include <utility>
#include <vector>

namespace strata {

namespace {

void trace(const MergeOptions& options, std::size_t depth, const std::string& message) {
    if (options.trace) {
        options.trace(depth, std::string(depth * 2, ' ') + message);
    }
}

void merge_node(Value& source, Value& dest, const MergeOptions& options, std::size_t depth);

void merge_object(Value& source, Value& dest, const MergeOptions& options, std::size_t depth) {
    if (source.empty()) {
        return;
    }

    if (!dest.is_object()) {
        if (options.trace) {
            trace(options, depth, "overwriting dest: " + source.dump() + " -over-> " + dest.dump());
        }
        resolve_unmergeable(source, dest, options);
        return;
    }

    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        auto& src_value = it.value();

        // A key holding null counts as absent
        auto found = dest.find(key);
        if (found != dest.end() && !found->is_null()) {
            if (options.trace) {
                trace(options, depth, "merging: " + key + " => " + src_value.dump());
            }
            merge_node(src_value, *found, options, depth + 1);
            continue;
        }

        if (src_value.is_null()) {
            dest[key] = nullptr;
            continue;
        }

        if (options.trace) {
            trace(options, depth, "merging over: " + key + " => " + src_value.dump());
        }

        // A fresh branch still goes through the engine so knockout
        // directives inside it are applied rather than copied.
        Value fresh = Value::object();
        merge_node(src_value, fresh, options, depth + 1);
        dest[key] = std::move(fresh);
    }
}

void merge_array(Value& source, Value& dest, const MergeOptions& options, std::size_t depth) {
    if (options.unpack_arrays) {
        const auto& delimiter = *options.unpack_arrays;
        if (options.trace) {
            trace(options, depth, "split/join on source: " + source.dump());
        }
        source = unpack_array(source, delimiter);
        if (dest.is_array()) {
            dest = unpack_array(dest, delimiter);
        }
    }

    if (options.knockout_prefix && remove_bare_knockouts(source, *options.knockout_prefix)) {
        if (options.trace) {
            trace(options, depth, "clearing dest: " + dest.dump());
        }
        clear_or_null(dest);
    }

    if (!dest.is_array()) {
        if (options.trace) {
            trace(options, depth, "overwriting dest: " + source.dump() + " -over-> " + dest.dump());
        }
        resolve_unmergeable(source, dest, options);
        return;
    }

    if (options.knockout_prefix) {
        std::size_t applied = apply_knockouts(source, dest, *options.knockout_prefix);
        if (applied > 0 && options.trace) {
            trace(options, depth, "knocked out " + std::to_string(applied) + " item(s)");
        }
    }

    if (options.trace) {
        trace(options, depth, "merging arrays: " + source.dump() + " :: " + dest.dump());
    }

    if (!options.legacy_array_concat) {
        dest = array_union(dest, source);
    } else if (options.horizontal_precedence) {
        for (auto& elem : source) {
            dest.push_back(std::move(elem));
        }
    } else {
        dest = std::move(source);
    }

    if (options.sort_merged_arrays) {
        sort_array(dest);
    }
}

void merge_node(Value& source, Value& dest, const MergeOptions& options, std::size_t depth) {
    if (source.is_null()) {
        return;
    }

    if (dest.is_null() && !options.preserve_unmergeables) {
        dest = std::move(source);
        return;
    }

    if (options.trace) {
        trace(options, depth, "Source type: " + type_name(source) +
                              " :: Dest type: " + type_name(dest));
    }

    switch (source.type()) {
        case Value::value_t::object:
            merge_object(source, dest, options, depth);
            break;
        case Value::value_t::array:
            merge_array(source, dest, options, depth);
            break;
        default:
            if (options.trace) {
                trace(options, depth, "Others: " + source.dump() + " :: " + dest.dump());
            }
            resolve_unmergeable(source, dest, options);
            break;
    }

    if (options.trace) {
        trace(options, depth, "Returning " + dest.dump());
    }
}

/**
 * @brief Reject a source nested deeper than options.max_depth
 *
 * Runs before any value is touched, so a failed merge leaves both
 * arguments as they were. Only objects are descended into, matching the
 * recursion of merge_node().
 */
void check_depth(const Value& source, const MergeOptions& options) {
    if (options.max_depth == 0) {
        return;
    }

    std::vector<std::pair<const Value*, std::size_t>> pending;
    pending.emplace_back(&source, 0);
    while (!pending.empty()) {
        const Value* node = pending.back().first;
        const std::size_t depth = pending.back().second;
        pending.pop_back();

        if (depth > options.max_depth) {
            throw MergeDepthExceeded(options.max_depth);
        }
        if (!node->is_object()) {
            continue;
        }
        for (const auto& child : *node) {
            pending.emplace_back(&child, depth + 1);
        }
    }
}

} // anonymous namespace

Value deep_merge(const Value& source, const Value& destination, const MergeOptions& options) {
    validate_options(options);
    check_depth(source, options);

    Value src = source;
    Value result = destination;
    merge_node(src, result, options, 0);
    return result;
}

Value& deep_merge_in_place(Value& source, Value& destination, const MergeOptions& options) {
    validate_options(options);
    check_depth(source, options);

    merge_node(source, destination, options, 0);
    return destination;
}

Value merge(const Value& overlay, const Value& base, bool legacy_array_concat) {
    return deep_merge(overlay, base, plain_merge_options(legacy_array_concat));
}

Value horizontal_merge(const Value& overlay, const Value& base, bool legacy_array_concat) {
    return deep_merge(overlay, base, horizontal_merge_options(legacy_array_concat));
}

Value role_merge(const Value& overlay, const Value& base, bool legacy_array_concat) {
    return deep_merge(overlay, base, role_merge_options(legacy_array_concat));
}

Value deep_merge_all(const std::vector<Value>& layers, const MergeOptions& options) {
    validate_options(options);

    if (layers.empty()) {
        return Value::object();
    }

    for (std::size_t i = 1; i < layers.size(); ++i) {
        check_depth(layers[i], options);
    }

    Value result = layers[0];
    for (std::size_t i = 1; i < layers.size(); ++i) {
        Value layer = layers[i];
        merge_node(layer, result, options, 0);
    }

    return result;
}

} // namespace strata
