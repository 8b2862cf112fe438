#include "gltf2mesh/ResourceFetcher.hpp"
#include "gltf2mesh/Logger.hpp"
#include <httplib.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace gltf2mesh {

    namespace {
        std::string lowercase(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    }

    std::string FileFetcher::contentTypeFor(const std::string& path) {
        std::string ext = lowercase(std::filesystem::path(path).extension().string());
        if (ext == ".gltf") {
            return "model/gltf+json";
        }
        if (ext == ".glb") {
            return "model/gltf-binary";
        }
        return "application/octet-stream";
    }

    FetchResult FileFetcher::fetch(const std::string& location) {
        std::string path = location;
        if (path.compare(0, 7, "file://") == 0) {
            path = path.substr(7);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Could not open file for reading: " + path);
        }

        FetchResult result;
        result.body.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error("Error while reading file: " + path);
        }
        result.contentType = contentTypeFor(path);

        Logger::debug("Read " + std::to_string(result.body.size()) + " bytes from " + path);
        return result;
    }

    HttpFetcher::HttpFetcher(unsigned int timeoutSeconds)
            : timeoutSeconds(timeoutSeconds) {}

    bool HttpFetcher::isHttpUrl(const std::string& location) {
        return location.find("http://") == 0 || location.find("https://") == 0;
    }

    FetchResult HttpFetcher::fetch(const std::string& location) {
        if (!isHttpUrl(location)) {
            throw std::runtime_error("Not an http(s) url: " + location);
        }

        // Separa schema://host:porta dal path della richiesta
        size_t hostStart = location.find("://") + 3;
        size_t pathStart = location.find('/', hostStart);
        std::string schemeHostPort = location.substr(0, pathStart);
        std::string path = pathStart == std::string::npos ? "/" : location.substr(pathStart);

        Logger::debug("Connecting to " + schemeHostPort);

        httplib::Client cli(schemeHostPort);
        cli.set_connection_timeout(timeoutSeconds);
        cli.set_read_timeout(timeoutSeconds);
        cli.set_follow_location(true);

        auto res = cli.Get(path);
        if (!res) {
            throw std::runtime_error("HTTP connection error: " + httplib::to_string(res.error()));
        }

        if (res->status != 200) {
            throw std::runtime_error("Download failed with status: " + std::to_string(res->status));
        }

        FetchResult result;
        result.body.assign(res->body.begin(), res->body.end());
        result.contentType = res->get_header_value("Content-Type");

        Logger::debug("Downloaded " + std::to_string(result.body.size()) + " bytes from " + location);
        return result;
    }

    DefaultFetcher::DefaultFetcher(unsigned int httpTimeoutSeconds)
            : http(httpTimeoutSeconds) {}

    FetchResult DefaultFetcher::fetch(const std::string& location) {
        if (HttpFetcher::isHttpUrl(location)) {
            return http.fetch(location);
        }
        return files.fetch(location);
    }

    ConfinedFetcher::ConfinedFetcher(std::string assetRoot, unsigned int httpTimeoutSeconds)
            : http(httpTimeoutSeconds) {
        if (!assetRoot.empty()) {
            this->assetRoot = std::filesystem::weakly_canonical(std::filesystem::path(assetRoot)).string();
        }
    }

    std::string ConfinedFetcher::confine(const std::string& location) const {
        if (assetRoot.empty()) {
            throw std::runtime_error("Local file access is disabled: " + location);
        }

        std::string relative = location;
        if (relative.compare(0, 7, "file://") == 0) {
            relative = relative.substr(7);
        }
        relative.erase(0, relative.find_first_not_of('/'));

        namespace fs = std::filesystem;
        const fs::path root(assetRoot);
        const fs::path resolved = fs::weakly_canonical(root / relative);

        // resolved deve avere root come prefisso, componente per componente
        auto mismatch = std::mismatch(root.begin(), root.end(), resolved.begin(), resolved.end());
        if (mismatch.first != root.end()) {
            throw std::runtime_error("Path is outside the asset root: " + location);
        }
        return resolved.string();
    }

    FetchResult ConfinedFetcher::fetch(const std::string& location) {
        if (HttpFetcher::isHttpUrl(location)) {
            return http.fetch(location);
        }
        return files.fetch(confine(location));
    }

} // namespace gltf2mesh
