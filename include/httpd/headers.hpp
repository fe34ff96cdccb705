#ifndef HTTPD_HEADERS_HPP_INCLUDED
#define HTTPD_HEADERS_HPP_INCLUDED
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace httpd {
    bool iequals(std::string_view lhs, std::string_view rhs);

    enum class duplicate_policy { join, last_wins };

    // Header fields with case-insensitive names. Entries keep insertion order so that
    // serialisation is deterministic.
    class header_map {
        public:
        using value_type = std::pair<std::string, std::string>;
        using container = std::vector<value_type>;
        using const_iterator = container::const_iterator;

        // Replaces the value of an existing field in place, appends otherwise
        void set(std::string name, std::string value);
        // Adds a field received on the wire, resolving repeats with the given policy
        void add(std::string name, std::string value, duplicate_policy policy = duplicate_policy::join);
        bool erase(std::string_view name);

        std::optional<std::string> get(std::string_view name) const;
        bool contains(std::string_view name) const;
        // True if the comma separated value of name lists token (case-insensitive)
        bool has_token(std::string_view name, std::string_view token) const;

        std::size_t size() const { return fields.size(); }
        bool empty() const { return fields.empty(); }
        const_iterator begin() const { return fields.begin(); }
        const_iterator end() const { return fields.end(); }

        private:
        container::iterator find(std::string_view name);
        container::const_iterator find(std::string_view name) const;

        container fields;
    };
}
#endif
