#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <exception>
#include <functional>
#include <algorithm>
#include <utility>
#include <cstddef>

namespace gltf2mesh {

    // Thread sempre joinati alla distruzione, anche durante lo stack unwinding
    class JoiningThreads {
    public:
        JoiningThreads() = default;
        JoiningThreads(const JoiningThreads&) = delete;
        JoiningThreads& operator=(const JoiningThreads&) = delete;

        ~JoiningThreads() {
            join();
        }

        template <typename Fn>
        void spawn(Fn&& fn) {
            threads.emplace_back(std::forward<Fn>(fn));
        }

        void join() {
            for (auto& thread : threads) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        }

        size_t size() const { return threads.size(); }

    private:
        std::vector<std::thread> threads;
    };

/**
 * @class TaskGroup
 * @brief Esegue N task indipendenti su un numero limitato di thread
 *
 * run() ritorna solo dopo il join di tutti i worker. Dopo il primo
 * fallimento i task non ancora avviati vengono saltati; viene rilanciata
 * l'eccezione del task fallito con indice piu' basso e i risultati
 * parziali vanno scartati.
 */
    class TaskGroup {
    public:
        explicit TaskGroup(unsigned int workerCount)
                : workerCount(std::max(1u, workerCount)) {}

        void run(size_t taskCount, const std::function<void(size_t)>& task) const {
            if (taskCount == 0) {
                return;
            }

            std::vector<std::exception_ptr> failures(taskCount);
            std::atomic<size_t> next{0};
            std::atomic<bool> cancelled{false};

            auto worker = [&]() {
                for (size_t i = next.fetch_add(1); i < taskCount && !cancelled.load(); i = next.fetch_add(1)) {
                    try {
                        task(i);
                    } catch (...) {
                        // Ogni slot e' scritto da un solo worker
                        failures[i] = std::current_exception();
                        cancelled.store(true);
                    }
                }
            };

            size_t threads = std::min<size_t>(workerCount, taskCount);
            if (threads == 1) {
                worker();
            } else {
                JoiningThreads pool;
                try {
                    for (size_t t = 0; t < threads; ++t) {
                        pool.spawn(worker);
                    }
                } catch (...) {
                    // Creazione di un thread fallita: i worker avviati si fermano al task successivo
                    cancelled.store(true);
                    throw;
                }
                pool.join();
            }

            for (const auto& failure : failures) {
                if (failure) {
                    std::rethrow_exception(failure);
                }
            }
        }

        // Un risultato per task, nello stesso ordine degli indici
        template <typename T>
        std::vector<T> map(size_t taskCount, const std::function<T(size_t)>& task) const {
            std::vector<T> results(taskCount);
            run(taskCount, [&](size_t i) { results[i] = task(i); });
            return results;
        }

        unsigned int size() const { return workerCount; }

    private:
        unsigned int workerCount;
    };

} // namespace gltf2mesh
