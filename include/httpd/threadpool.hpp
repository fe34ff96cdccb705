#ifndef HTTPD_THREADPOOL_HPP_INCLUDED
#define HTTPD_THREADPOOL_HPP_INCLUDED
#include <vector>
#include <thread>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
namespace httpd {
    // Fixed set of threads draining a FIFO of tasks. Tasks still queued at destruction are
    // dropped (destroying their captures); running tasks are joined.
    class threadpool {
        std::vector<std::thread> workers;

        // Tasks
        std::deque<std::packaged_task<void()>> tasks;
        std::condition_variable task_available;
        std::mutex task_mutex;
        bool stopping = false;

        public:
        explicit threadpool(int n_threads) {
            workers.reserve(n_threads);
            for(int i = 0; i < n_threads; i++) {
                workers.emplace_back([this](){
                    while(true) {
                        std::packaged_task<void()> current_task;
                        {
                            std::unique_lock<std::mutex> lock(task_mutex);
                            task_available.wait(lock, [this](){ return stopping || !tasks.empty(); });
                            if(stopping) return;
                            current_task = std::move(tasks.front());
                            tasks.pop_front();
                        }
                        current_task();
                    }
                });
            }
        }

        threadpool(const threadpool&) = delete;
        threadpool& operator=(const threadpool&) = delete;

        ~threadpool() {
            {
                std::lock_guard<std::mutex> lock(task_mutex);
                stopping = true;
                tasks.clear();
            }
            task_available.notify_all();
            for(auto& w : workers) {
                w.join();
            }
        }

        template<typename F>
        void post_task(F&& f) {
            {
                std::lock_guard<std::mutex> lock(task_mutex);
                tasks.emplace_back(std::forward<F>(f));
            }
            task_available.notify_one();
        }
    };
}
#endif
