/**
 * @file ArrayOps.cpp
 * @brief Implementation of sequence helpers
 */

#include "strata/ArrayOps.hpp"

#include <algorithm>

namespace strata {

namespace {

void append_joined(std::string& out, const Value& sequence,
                   const std::string& delimiter, bool& first) {
    for (const auto& elem : sequence) {
        if (elem.is_array()) {
            append_joined(out, elem, delimiter, first);
            continue;
        }
        if (!first) out += delimiter;
        first = false;

        if (elem.is_string()) {
            out += elem.get_ref<const std::string&>();
        } else if (!elem.is_null()) {
            out += elem.dump();
        }
    }
}

bool contains_value(const Value& sequence, const Value& item) {
    return std::find(sequence.begin(), sequence.end(), item) != sequence.end();
}

} // anonymous namespace

std::string join_values(const Value& sequence, const std::string& delimiter) {
    std::string out;
    bool first = true;
    append_joined(out, sequence, delimiter, first);
    return out;
}

std::vector<std::string> split_string(const std::string& text, const std::string& delimiter) {
    std::vector<std::string> parts;
    if (text.empty()) return parts;
    if (delimiter.empty()) {
        parts.push_back(text);
        return parts;
    }

    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + delimiter.size();
    }

    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    return parts;
}

Value unpack_array(const Value& sequence, const std::string& delimiter) {
    Value out = Value::array();
    for (auto& part : split_string(join_values(sequence, delimiter), delimiter)) {
        out.push_back(Value(std::move(part)));
    }
    return out;
}

Value array_union(const Value& first, const Value& second) {
    Value out = Value::array();
    for (const auto* seq : {&first, &second}) {
        for (const auto& elem : *seq) {
            if (!contains_value(out, elem)) {
                out.push_back(elem);
            }
        }
    }
    return out;
}

std::size_t erase_all(Value& sequence, const Value& item) {
    if (!sequence.is_array()) return 0;

    std::size_t removed = 0;
    for (std::size_t i = sequence.size(); i-- > 0;) {
        if (sequence[i] == item) {
            sequence.erase(i);
            ++removed;
        }
    }
    return removed;
}

void sort_array(Value& sequence) {
    if (!sequence.is_array()) return;
    auto& elems = sequence.get_ref<Value::array_t&>();
    std::stable_sort(elems.begin(), elems.end(),
                     [](const Value& a, const Value& b) { return a < b; });
}

} // namespace strata
