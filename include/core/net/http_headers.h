/**
 * @file http_headers.h
 * @brief Ordered, case-insensitive, multi-valued HTTP header map.
 */

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace restkit::nethttp {

struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const;
};

// Canonical MIME form: "content-type" -> "Content-Type". Keys containing
// characters outside the RFC 7230 token set are returned unchanged.
std::string canonical_header_key(std::string_view name);

class Headers {
public:
    using Map = std::map<std::string, std::vector<std::string>, CaseInsensitiveLess>;
    using const_iterator = Map::const_iterator;

    // Appends value to the values already stored under name.
    void add(std::string_view name, std::string_view value);
    // Replaces every value stored under name.
    void set(std::string_view name, std::string_view value);
    // First value stored under name, or an empty string.
    std::string get(std::string_view name) const;
    std::vector<std::string> values(std::string_view name) const;
    bool contains(std::string_view name) const;
    void erase(std::string_view name);
    void clear() {
        map_.clear();
        last_name_.clear();
    }

    bool empty() const { return map_.empty(); }
    std::size_t size() const { return map_.size(); }
    const_iterator begin() const { return map_.begin(); }
    const_iterator end() const { return map_.end(); }

    // "Name: value" lines, one per value, in map order.
    std::vector<std::string> to_lines() const;

    // Parses a single "Name: value" header line (CRLF tolerated). A line
    // starting with SP or HTAB continues the value of the previous line.
    // Lines without a colon, and continuations with nothing to continue,
    // are ignored and false is returned.
    bool add_line(std::string_view line);

private:
    Map map_;
    std::string last_name_;
};

} // namespace restkit::nethttp
