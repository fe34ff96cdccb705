#ifndef HTTPD_CONTENT_SOURCE_HPP_INCLUDED
#define HTTPD_CONTENT_SOURCE_HPP_INCLUDED
#include <optional>
#include <string>
#include <unordered_map>
#include <boost/filesystem.hpp>
namespace httpd {
    struct content {
        std::string bytes;
        // Path of the entry actually served, e.g. "/docs/index.html" for "/docs"
        std::string resolved_path;
    };

    // Read-only mapping from a normalised path to bytes. Implementations must tolerate
    // concurrent lookups from every connection thread.
    class content_source {
        public:
        virtual ~content_source() = default;
        virtual std::optional<content> lookup(const std::string& normalized_path) const = 0;
    };

    // Files below a document root; directories serve their index.html
    class directory_source : public content_source {
        boost::filesystem::path root;

        public:
        explicit directory_source(boost::filesystem::path root);
        std::optional<content> lookup(const std::string& normalized_path) const override;
    };

    class memory_source : public content_source {
        std::unordered_map<std::string, std::string> entries;

        public:
        memory_source() = default;
        memory_source(std::initializer_list<std::pair<const std::string, std::string>> init);
        void add(std::string path, std::string bytes);
        std::optional<content> lookup(const std::string& normalized_path) const override;
    };
}
#endif
