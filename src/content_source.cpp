#include <httpd/content_source.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace fs = boost::filesystem;

static const std::string index_file = "index.html";

// Maps a normalised request path below root. Symlinks leading outside the canonical root
// yield std::nullopt.
static std::optional<fs::path> chroot_map(const std::string& normalized, const fs::path& root) {
    fs::path mapped = root;
    mapped /= fs::path{normalized}.relative_path();
    boost::system::error_code ec;
    fs::path canon = fs::canonical(mapped, ec);
    if(ec) return std::nullopt;
    fs::path ceiling = fs::canonical(root, ec);
    if(ec) return std::nullopt;
    auto [first_mismatch, _] = std::mismatch(
        ceiling.begin(), ceiling.end(),
        canon.begin(), canon.end()
    );
    if(first_mismatch != ceiling.end()) {
        BOOST_LOG_TRIVIAL(warning) << "* " << normalized << " escapes the document root";
        return std::nullopt;
    }
    return canon;
}

httpd::directory_source::directory_source(fs::path root) : root(std::move(root)) {
}

std::optional<httpd::content> httpd::directory_source::lookup(const std::string& normalized_path) const {
    auto mapped = chroot_map(normalized_path, root);
    if(!mapped) return std::nullopt;

    std::string served = normalized_path;
    boost::system::error_code ec;
    if(fs::is_directory(*mapped, ec)) {
        *mapped /= index_file;
        if(served.empty() || served.back() != '/') served += '/';
        served += index_file;
    }
    if(!fs::is_regular_file(*mapped, ec)) return std::nullopt;

    fs::ifstream file{*mapped, std::ios::binary};
    if(!file.is_open()) return std::nullopt;
    content c;
    c.bytes.assign(std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{});
    if(file.bad()) {
        throw std::runtime_error("read failed for " + mapped->string());
    }
    c.resolved_path = std::move(served);
    return c;
}

httpd::memory_source::memory_source(std::initializer_list<std::pair<const std::string, std::string>> init)
    : entries(init) {
}

void httpd::memory_source::add(std::string path, std::string bytes) {
    entries[std::move(path)] = std::move(bytes);
}

std::optional<httpd::content> httpd::memory_source::lookup(const std::string& normalized_path) const {
    if(auto it = entries.find(normalized_path); it != entries.end()) {
        return content{it->second, normalized_path};
    }
    std::string index = normalized_path;
    if(index.empty() || index.back() != '/') index += '/';
    index += index_file;
    if(auto it = entries.find(index); it != entries.end()) {
        return content{it->second, index};
    }
    return std::nullopt;
}
