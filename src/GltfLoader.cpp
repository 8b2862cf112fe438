#include "gltf2mesh/GltfLoader.hpp"
#include "gltf2mesh/BufferResolver.hpp"
#include "gltf2mesh/DocumentParser.hpp"
#include "gltf2mesh/GlbContainer.hpp"
#include "gltf2mesh/MeshAssembler.hpp"
#include "gltf2mesh/PathResolver.hpp"
#include "gltf2mesh/TaskGroup.hpp"
#include "gltf2mesh/Hasher.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <thread>
#include <utility>

namespace gltf2mesh {

    namespace {
        enum class AssetFormat {
            Json,
            Binary
        };

        bool contains(const std::string& value, const char* needle) {
            return value.find(needle) != std::string::npos;
        }

        bool isGenericContentType(const std::string& contentType) {
            return contentType.empty() ||
                   contains(contentType, "application/octet-stream") ||
                   contains(contentType, "application/json") ||
                   contains(contentType, "text/plain");
        }

        AssetFormat detectFormat(const std::vector<uint8_t>& bytes, const std::string& contentType) {
            if (contains(contentType, "model/gltf-binary")) {
                return AssetFormat::Binary;
            }
            if (contains(contentType, "model/gltf+json")) {
                return AssetFormat::Json;
            }
            // Server e file system che non conoscono i tipi glTF: decide il magic del GLB
            if (isGenericContentType(contentType)) {
                return GlbContainer::isGlb(bytes) ? AssetFormat::Binary : AssetFormat::Json;
            }
            throw LoadError("Given url asset is not validated gltf file. "
                            "Expecting content type is \"model/gltf+json\" or \"model/gltf-binary\". Get " +
                            contentType);
        }

        long long elapsedMs(std::chrono::high_resolution_clock::time_point since) {
            auto now = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count();
        }
    }

    GltfLoader::GltfLoader(LoaderOptions options, std::shared_ptr<ResourceFetcher> fetcher)
            : options(std::move(options)), fetcher(std::move(fetcher)) {
        if (!this->fetcher) {
            this->fetcher = std::make_shared<DefaultFetcher>(this->options.httpTimeoutSeconds);
        }
    }

    unsigned int GltfLoader::workers() const {
        if (options.workerCount > 0) {
            return options.workerCount;
        }
        return std::max(1u, std::thread::hardware_concurrency());
    }

    LoadResult GltfLoader::load(const std::string& url) const {
        if (url.empty()) {
            throw LoadError("GltfLoader::load: Given url is undefined or empty.");
        }

        Logger::info("Loading glTF asset: " + url);
        auto fetch_start = std::chrono::high_resolution_clock::now();

        FetchResult fetched;
        try {
            fetched = fetcher->fetch(url);
        } catch (const std::exception& e) {
            throw LoadError("Can not load glTF asset " + url + ": " + e.what());
        }

        Logger::info("Fetched " + std::to_string(fetched.body.size() / 1024) + " KB in " +
                     std::to_string(elapsedMs(fetch_start)) + "ms");

        return loadFromMemory(fetched.body, url, fetched.contentType);
    }

    LoadResult GltfLoader::loadFromMemory(const std::vector<uint8_t>& bytes,
                                          const std::string& sourceUrl,
                                          const std::string& contentType) const {
        auto start_time = std::chrono::high_resolution_clock::now();

        // Le opzioni non vengono modificate: le radici valgono solo per questo caricamento
        std::string rootPath = options.rootPath.empty() ? PathResolver::parentOf(sourceUrl) : options.rootPath;
        std::string bufferRootPath = options.bufferRootPath.empty() ? rootPath : options.bufferRootPath;

        Document document;
        std::optional<std::vector<uint8_t>> embeddedBin;

        if (detectFormat(bytes, contentType) == AssetFormat::Binary) {
            GlbContainer glb = GlbContainer::parse(bytes);
            document = DocumentParser::parse(glb.json);
            embeddedBin = std::move(glb.bin);
        } else {
            document = DocumentParser::parse(std::string(bytes.begin(), bytes.end()));
        }

        auto buffers_start = std::chrono::high_resolution_clock::now();
        RawBuffers buffers = loadBuffers(document, bufferRootPath, embeddedBin ? &*embeddedBin : nullptr);
        Logger::info("Loaded " + std::to_string(buffers.size()) + " buffers in " +
                     std::to_string(elapsedMs(buffers_start)) + "ms");

        LoadResult result = parse(document, buffers);
        result.sourceUrl = sourceUrl;
        result.documentSha256 = Hasher::sha256(bytes);

        Logger::info("Completed glTF load: " + std::to_string(result.meshes.size()) + " meshes in " +
                     std::to_string(elapsedMs(start_time)) + "ms");
        return result;
    }

    RawBuffers GltfLoader::loadBuffers(const Document& document,
                                       const std::string& bufferRootPath,
                                       const std::vector<uint8_t>* embeddedBin) const {
        BufferResolver resolver(*fetcher, bufferRootPath);
        TaskGroup group(workers());

        // Un task per buffer; il join avviene prima di ritagliare le view
        return group.map<std::vector<uint8_t>>(document.buffers.size(), [&](size_t i) {
            return resolver.resolve(document.buffers[i], embeddedBin);
        });
    }

    BufferViewTable GltfLoader::sliceBufferViews(const Document& document, const RawBuffers& buffers) {
        BufferViewTable views;
        views.reserve(document.bufferViews.size());

        for (size_t i = 0; i < document.bufferViews.size(); ++i) {
            const BufferView& view = document.bufferViews[i];
            if (view.buffer >= buffers.size()) {
                throw MalformedDataError("Buffer view " + std::to_string(i) + " references missing buffer " +
                                         std::to_string(view.buffer));
            }
            const auto& source = buffers[view.buffer];
            if (view.byteOffset > source.size() || view.byteLength > source.size() - view.byteOffset) {
                throw MalformedDataError("Buffer view " + std::to_string(i) + " exceeds buffer " +
                                         std::to_string(view.buffer) + " (" + std::to_string(source.size()) +
                                         " bytes)");
            }
            auto begin = source.begin() + static_cast<std::ptrdiff_t>(view.byteOffset);
            views.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(view.byteLength));
        }
        return views;
    }

    LoadResult GltfLoader::parse(const Document& document, const RawBuffers& buffers) const {
        if (buffers.size() != document.buffers.size()) {
            throw BufferCompletenessError("Can not load all buffers: " + std::to_string(buffers.size()) +
                                          " of " + std::to_string(document.buffers.size()));
        }

        const BufferViewTable views = sliceBufferViews(document, buffers);

        std::vector<std::pair<size_t, size_t>> jobs;
        for (size_t m = 0; m < document.meshes.size(); ++m) {
            for (size_t p = 0; p < document.meshes[m].primitives.size(); ++p) {
                jobs.emplace_back(m, p);
            }
        }

        auto assemble_start = std::chrono::high_resolution_clock::now();
        TaskGroup group(workers());
        std::vector<Geometry> geometries = group.map<Geometry>(jobs.size(), [&](size_t i) {
            return MeshAssembler::assemble(document, views, jobs[i].first, jobs[i].second, options);
        });
        Logger::info("Assembled " + std::to_string(jobs.size()) + " primitives on " +
                     std::to_string(group.size()) + " workers in " +
                     std::to_string(elapsedMs(assemble_start)) + "ms");

        LoadResult result;
        result.meshes.resize(document.meshes.size());
        for (const auto& mesh : document.meshes) {
            result.meshNames.push_back(mesh.name);
        }
        for (size_t i = 0; i < jobs.size(); ++i) {
            result.meshes[jobs[i].first].push_back(std::move(geometries[i]));
        }
        return result;
    }

} // namespace gltf2mesh
