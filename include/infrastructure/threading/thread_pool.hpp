#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace CIP {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    double average_task_duration_ms = 0.0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool size and queue limits.
// FR: Configuration de la taille du pool et des limites de la queue.
struct ThreadPoolConfig {
    // EN: Number of worker threads (fixed for the lifetime of the pool).
    // FR: Nombre de threads workers (fixe pendant la vie du pool).
    size_t threads = std::max(1u, std::thread::hardware_concurrency());

    // EN: Maximum number of queued tasks, 0 means unbounded.
    // FR: Nombre maximum de tâches en queue, 0 signifie illimité.
    size_t max_queue_size = 1000;
};

namespace detail {
    // EN: Internal task wrapper with priority and metadata.
    // FR: Wrapper interne de tâche avec priorité et métadonnées.
    struct Task {
        std::function<void()> function;
        TaskPriority priority;
        uint64_t sequence = 0;
        std::string name;

        Task(std::function<void()> f, TaskPriority p, uint64_t seq, const std::string& n = "")
            : function(std::move(f)), priority(p), sequence(seq), name(n) {}

        bool operator<(const Task& other) const {
            // EN: Higher priority first, then FIFO within a priority level.
            // FR: Priorité plus élevée d'abord, puis FIFO dans un même niveau.
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

// EN: Fixed-size thread pool with a priority queue. Runs dispatched pipeline stages.
// FR: Pool de threads de taille fixe avec queue prioritaire. Exécute les stages dispatchés.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for all tasks to complete and stops all threads.
    // FR: Destructeur - attend que toutes les tâches se terminent et arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // EN: Submit a task with specified priority and return a future.
    // FR: Soumet une tâche avec priorité spécifiée et retourne un future.
    template<typename F, typename... Args>
    auto submit(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task with priority for better debugging.
    // FR: Soumet une tâche nommée avec priorité pour un meilleur débogage.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued tasks to complete.
    // FR: Attend que toutes les tâches actuellement en queue se terminent.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully (drains the queue).
    // FR: Arrête le pool de threads de manière gracieuse (vide la queue).
    void shutdown();

    ThreadPoolStats getStats() const;
    const ThreadPoolConfig& getConfig() const { return config_; }

    // EN: Set callback for task completion events.
    // FR: Définit le callback pour les événements de completion des tâches.
    void setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback);

private:
    void workerLoop();
    void updateStats(const std::string& task_name, bool success, std::chrono::milliseconds duration);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;
    std::mutex threads_mutex_;

    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};

    std::chrono::system_clock::time_point start_time_;
    mutable std::mutex stats_mutex_;
    double total_duration_ms_ = 0.0;
    size_t finished_count_ = 0;

    std::function<void(const std::string&, bool, std::chrono::milliseconds)> task_callback_;
    std::mutex callback_mutex_;
};

// EN: Template method implementations.
// FR: Implémentations des méthodes templates.
template<typename F, typename... Args>
auto ThreadPool::submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", priority, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.emplace([task]() {
            (*task)();
        }, priority, next_sequence_++, name);

        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }

    queue_condition_.notify_one();
    return result;
}

} // namespace CIP
