/**
 * @file http_headers.cpp
 */

#include "core/net/http_headers.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <utility>

namespace restkit::nethttp {

namespace {

bool is_token_char(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

} // namespace

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::string canonical_header_key(std::string_view name) {
    if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) {
            return is_token_char(static_cast<unsigned char>(c));
        })) {
        return std::string(name);
    }
    std::string out(name);
    bool upper = true;
    for (auto& ch : out) {
        auto c = static_cast<unsigned char>(ch);
        ch = static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
        upper = (ch == '-');
    }
    return out;
}

void Headers::add(std::string_view name, std::string_view value) {
    auto it = map_.find(name);
    if (it == map_.end()) {
        map_.emplace(canonical_header_key(name), std::vector<std::string>{std::string(value)});
        return;
    }
    it->second.emplace_back(value);
}

void Headers::set(std::string_view name, std::string_view value) {
    auto it = map_.find(name);
    if (it == map_.end()) {
        map_.emplace(canonical_header_key(name), std::vector<std::string>{std::string(value)});
        return;
    }
    it->second.assign(1, std::string(value));
}

std::string Headers::get(std::string_view name) const {
    auto it = map_.find(name);
    if (it == map_.end() || it->second.empty()) {
        return {};
    }
    return it->second.front();
}

std::vector<std::string> Headers::values(std::string_view name) const {
    auto it = map_.find(name);
    if (it == map_.end()) {
        return {};
    }
    return it->second;
}

bool Headers::contains(std::string_view name) const {
    return map_.find(name) != map_.end();
}

void Headers::erase(std::string_view name) {
    auto it = map_.find(name);
    if (it != map_.end()) {
        map_.erase(it);
    }
}

std::vector<std::string> Headers::to_lines() const {
    std::vector<std::string> lines;
    for (const auto& [name, vals] : map_) {
        for (const auto& v : vals) {
            lines.push_back(name + ": " + v);
        }
    }
    return lines;
}

bool Headers::add_line(std::string_view line) {
    if (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        auto it = last_name_.empty() ? map_.end() : map_.find(last_name_);
        if (it == map_.end()) {
            return false;
        }
        const auto extra = utils::trim_ascii(line);
        auto& value = it->second.back();
        if (!extra.empty()) {
            if (!value.empty()) {
                value.push_back(' ');
            }
            value += extra;
        }
        return true;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    auto name = utils::trim_ascii(line.substr(0, colon));
    if (name.empty()) {
        return false;
    }
    add(name, utils::trim_ascii(line.substr(colon + 1)));
    last_name_ = std::move(name);
    return true;
}

} // namespace restkit::nethttp
