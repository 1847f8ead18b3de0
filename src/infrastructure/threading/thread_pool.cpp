// EN: Implementation of the ThreadPool class. Fixed set of workers over a priority queue.
// FR: Implémentation de la classe ThreadPool. Ensemble fixe de workers sur une queue prioritaire.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

namespace CIP {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    if (config_.threads == 0) {
        throw std::invalid_argument("thread pool needs at least one thread");
    }

    // EN: Create worker threads.
    // FR: Crée les threads workers.
    std::lock_guard<std::mutex> lock(threads_mutex_);
    workers_.reserve(config_.threads);
    for (size_t i = 0; i < config_.threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(config_.threads) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

// EN: Wait for all currently queued tasks to complete.
// FR: Attend que toutes les tâches actuellement en queue se terminent.
void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return; // EN: Already shutting down. FR: Déjà en cours d'arrêt.
    }

    waitForAll();
    queue_condition_.notify_all();

    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG("threadpool", "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats current_stats;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        current_stats.queued_tasks = task_queue_.size();
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        current_stats.average_task_duration_ms =
            finished_count_ > 0 ? total_duration_ms_ / static_cast<double>(finished_count_) : 0.0;
    }

    current_stats.total_threads = config_.threads;
    current_stats.active_threads = active_threads_.load();
    current_stats.idle_threads = current_stats.total_threads - current_stats.active_threads;
    current_stats.completed_tasks = completed_tasks_.load();
    current_stats.failed_tasks = failed_tasks_.load();
    current_stats.peak_queue_size = peak_queue_size_.load();
    current_stats.created_at = start_time_;
    current_stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);

    return current_stats;
}

void ThreadPool::setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    task_callback_ = std::move(callback);
}

// EN: Worker thread function.
// FR: Fonction du thread worker.
void ThreadPool::workerLoop() {
    while (true) {
        detail::Task task([] {}, TaskPriority::NORMAL, 0);

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break; // EN: Shutdown with drained queue. FR: Arrêt avec queue vide.
            }

            task = std::move(const_cast<detail::Task&>(task_queue_.top()));
            task_queue_.pop();
            active_threads_++;
        }

        auto start = std::chrono::system_clock::now();
        bool success = true;

        // EN: packaged_task stores exceptions in the future; this only guards the wrapper.
        // FR: packaged_task stocke les exceptions dans le future ; ceci protège le wrapper.
        try {
            task.function();
        } catch (const std::exception& e) {
            success = false;
            LOG_ERROR("threadpool", "Task execution failed: " + std::string(e.what()));
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - start);

        if (success) {
            completed_tasks_++;
        } else {
            failed_tasks_++;
        }
        updateStats(task.name, success, duration);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

void ThreadPool::updateStats(const std::string& task_name, bool success, std::chrono::milliseconds duration) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        finished_count_++;
        total_duration_ms_ += static_cast<double>(duration.count());
    }

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (task_callback_) {
        try {
            task_callback_(task_name, success, duration);
        } catch (const std::exception& e) {
            LOG_ERROR("threadpool", "Task callback failed: " + std::string(e.what()));
        }
    }
}

} // namespace CIP
