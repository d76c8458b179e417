/**
 * @file Knockout.cpp
 * @brief Implementation of knockout handling and unmergeable resolution
 */

#include "strata/Knockout.hpp"
#include "strata/ArrayOps.hpp"

namespace strata {

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::string knockout_marker(const std::string& prefix) {
    return prefix + ":";
}

bool is_bare_knockout(const Value& item, const std::string& prefix) {
    if (!item.is_string()) return false;
    const auto& text = item.get_ref<const std::string&>();
    return text == prefix || text == knockout_marker(prefix);
}

std::optional<std::string> knockout_target(const Value& item, const std::string& prefix) {
    if (!item.is_string()) return std::nullopt;

    const auto& text = item.get_ref<const std::string&>();
    const std::string marker = knockout_marker(prefix);
    if (!starts_with(text, marker)) return std::nullopt;
    return text.substr(marker.size());
}

bool remove_bare_knockouts(Value& sequence, const std::string& prefix) {
    if (!sequence.is_array()) return false;

    bool removed = false;
    for (std::size_t i = sequence.size(); i-- > 0;) {
        if (is_bare_knockout(sequence[i], prefix)) {
            sequence.erase(i);
            removed = true;
        }
    }
    return removed;
}

void clear_or_null(Value& value) {
    if (is_container(value) || value.is_string()) {
        value.clear();
    } else {
        value = nullptr;
    }
}

std::size_t apply_knockouts(Value& source, Value& destination, const std::string& prefix) {
    Value kept = Value::array();
    std::size_t applied = 0;

    for (auto& item : source) {
        auto target = knockout_target(item, prefix);
        if (!target) {
            kept.push_back(std::move(item));
            continue;
        }
        erase_all(destination, Value(*target));
        erase_all(destination, item);
        ++applied;
    }

    source = std::move(kept);
    return applied;
}

void resolve_unmergeable(Value& source, Value& destination, const MergeOptions& options) {
    if (options.preserve_unmergeables) {
        return;
    }
    if (!options.knockout_prefix) {
        destination = std::move(source);
        return;
    }

    const std::string& prefix = *options.knockout_prefix;

    switch (source.type()) {
        case Value::value_t::string: {
            const auto& text = source.get_ref<const std::string&>();
            if (text == prefix) {
                destination = "";
            } else if (auto target = knockout_target(source, prefix)) {
                destination = std::move(*target);
            } else {
                destination = std::move(source);
            }
            break;
        }
        case Value::value_t::array: {
            Value filtered = Value::array();
            for (auto& item : source) {
                if (!knockout_target(item, prefix)) {
                    filtered.push_back(std::move(item));
                }
            }
            if (filtered.size() == source.size()) {
                destination = std::move(filtered);
            } else {
                destination = "";
            }
            break;
        }
        default:
            destination = std::move(source);
            break;
    }
}

} // namespace strata
