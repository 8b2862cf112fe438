#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace gltf2mesh {

    struct FetchResult {
        std::vector<uint8_t> body;
        std::string contentType;
    };

/**
 * @class ResourceFetcher
 * @brief Collaboratore di I/O usato dal loader per documenti e buffer
 *
 * Le implementazioni segnalano gli errori con std::runtime_error;
 * il loader li converte in LoadError o BufferLoadError.
 * fetch() puo' essere chiamato da piu' thread contemporaneamente.
 */
    class ResourceFetcher {
    public:
        virtual ~ResourceFetcher() = default;

        virtual FetchResult fetch(const std::string& location) = 0;
    };

    class FileFetcher : public ResourceFetcher {
    public:
        FetchResult fetch(const std::string& location) override;

        // ".gltf" -> model/gltf+json, ".glb" -> model/gltf-binary
        static std::string contentTypeFor(const std::string& path);
    };

    class HttpFetcher : public ResourceFetcher {
    public:
        explicit HttpFetcher(unsigned int timeoutSeconds = 30);

        FetchResult fetch(const std::string& location) override;

        static bool isHttpUrl(const std::string& location);

    private:
        unsigned int timeoutSeconds;
    };

    // Instrada gli URL http(s) verso HttpFetcher e tutto il resto verso FileFetcher
    class DefaultFetcher : public ResourceFetcher {
    public:
        explicit DefaultFetcher(unsigned int httpTimeoutSeconds = 30);

        FetchResult fetch(const std::string& location) override;

    private:
        FileFetcher files;
        HttpFetcher http;
    };

/**
 * @class ConfinedFetcher
 * @brief Fetcher per le richieste arrivate dal server
 *
 * Gli URL http(s) passano a HttpFetcher. I percorsi locali sono sempre
 * relativi ad assetRoot (anche se iniziano con '/') e non possono uscirne,
 * nemmeno tramite symlink. Con assetRoot vuoto l'accesso locale e' disabilitato.
 */
    class ConfinedFetcher : public ResourceFetcher {
    public:
        ConfinedFetcher(std::string assetRoot, unsigned int httpTimeoutSeconds = 30);

        FetchResult fetch(const std::string& location) override;

        // Percorso canonico dentro assetRoot; std::runtime_error se esce dalla radice
        std::string confine(const std::string& location) const;

    private:
        std::string assetRoot;
        FileFetcher files;
        HttpFetcher http;
    };

} // namespace gltf2mesh
