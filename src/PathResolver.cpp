#include "gltf2mesh/PathResolver.hpp"
#include <vector>
#include <algorithm>
#include <sstream>

namespace gltf2mesh {

    namespace {
        std::vector<std::string> split(const std::string& value, char sep) {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream stream(value);
            while (std::getline(stream, part, sep)) {
                parts.push_back(part);
            }
            // getline non restituisce il segmento vuoto finale
            if (!value.empty() && value.back() == sep) {
                parts.emplace_back();
            }
            return parts;
        }

        std::string join(const std::vector<std::string>& parts, size_t from, char sep) {
            std::string out;
            for (size_t i = from; i < parts.size(); ++i) {
                if (i > from) out += sep;
                out += parts[i];
            }
            return out;
        }
    }

    std::string PathResolver::resolve(const std::string& path, const std::string& basePath) {
        if (basePath.empty() || (!path.empty() && path[0] == '/')) {
            return path;
        }

        std::vector<std::string> pathParts = split(path, '/');
        std::vector<std::string> baseParts = split(basePath, '/');

        // "scheme:", "" e host di un URL non vengono mai rimossi
        const size_t keep = basePath.find("://") != std::string::npos ? std::min<size_t>(3, baseParts.size()) : 0;

        size_t first = 0;
        while (first < pathParts.size() &&
               (pathParts[first] == "." || pathParts[first] == "..")) {
            if (pathParts[first] == ".." && baseParts.size() > keep) {
                baseParts.pop_back();
            }
            ++first;
        }

        std::string base = join(baseParts, 0, '/');
        std::string rest = join(pathParts, first, '/');
        if (base.empty()) {
            return rest;
        }
        return base + "/" + rest;
    }

    bool PathResolver::isDataUri(const std::string& uri) {
        return dataUriPayloadOffset(uri) != std::string::npos;
    }

    size_t PathResolver::dataUriPayloadOffset(const std::string& uri) {
        if (uri.compare(0, 5, "data:") != 0) {
            return std::string::npos;
        }
        const std::string marker = "base64,";
        size_t pos = uri.find(marker);
        if (pos == std::string::npos) {
            return std::string::npos;
        }
        return pos + marker.size();
    }

    std::string PathResolver::parentOf(const std::string& url) {
        size_t slash = url.find_last_of('/');
        if (slash == std::string::npos) {
            return "";
        }
        return url.substr(0, slash);
    }

} // namespace gltf2mesh
