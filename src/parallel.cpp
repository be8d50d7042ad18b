#include "orotune/parallel.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace orotune {

size_t resolve_thread_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

void parallel_for(size_t count, size_t n_threads, const std::function<void(size_t)>& body) {
    if (count == 0) {
        return;
    }
    const size_t workers = std::min(count, resolve_thread_count(n_threads));
    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) body(i);
        return;
    }

    std::exception_ptr failure;
    std::mutex failure_mutex;
    std::vector<std::thread> threads;
    threads.reserve(workers);

    const size_t chunk = count / workers;
    const size_t extra = count % workers;
    size_t begin = 0;
    for (size_t w = 0; w < workers; ++w) {
        const size_t end = begin + chunk + (w < extra ? 1 : 0);
        threads.emplace_back([&, begin, end]() {
            try {
                for (size_t i = begin; i < end; ++i) body(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        });
        begin = end;
    }
    for (auto& t : threads) {
        t.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

}  // namespace orotune
