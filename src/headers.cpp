#include <httpd/headers.hpp>
#include <algorithm>
#include <cctype>

bool httpd::iequals(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b){
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

static std::string_view trim(std::string_view s) {
    const auto* ws = " \t";
    auto first = s.find_first_not_of(ws);
    if(first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

httpd::header_map::container::iterator httpd::header_map::find(std::string_view name) {
    return std::find_if(fields.begin(), fields.end(), [&](const value_type& f){ return iequals(f.first, name); });
}

httpd::header_map::container::const_iterator httpd::header_map::find(std::string_view name) const {
    return std::find_if(fields.begin(), fields.end(), [&](const value_type& f){ return iequals(f.first, name); });
}

void httpd::header_map::set(std::string name, std::string value) {
    auto it = find(name);
    if(it != fields.end()) {
        it->second = std::move(value);
    } else {
        fields.emplace_back(std::move(name), std::move(value));
    }
}

void httpd::header_map::add(std::string name, std::string value, duplicate_policy policy) {
    auto it = find(name);
    if(it == fields.end()) {
        fields.emplace_back(std::move(name), std::move(value));
    } else if(policy == duplicate_policy::join) {
        it->second += ", ";
        it->second += value;
    } else {
        it->second = std::move(value);
    }
}

bool httpd::header_map::erase(std::string_view name) {
    auto it = find(name);
    if(it == fields.end()) return false;
    fields.erase(it);
    return true;
}

std::optional<std::string> httpd::header_map::get(std::string_view name) const {
    auto it = find(name);
    if(it == fields.end()) return std::nullopt;
    return it->second;
}

bool httpd::header_map::contains(std::string_view name) const {
    return find(name) != fields.end();
}

bool httpd::header_map::has_token(std::string_view name, std::string_view token) const {
    auto it = find(name);
    if(it == fields.end()) return false;
    std::string_view rest = it->second;
    while(!rest.empty()) {
        auto comma = rest.find(',');
        auto item = trim(rest.substr(0, comma));
        // Parameters such as ";q=0.5" do not take part in the match
        item = trim(item.substr(0, item.find(';')));
        if(iequals(item, token)) return true;
        if(comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return false;
}
