#include <pictor/app/batch_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pictor::app {

ImageResult run_process(const pictor::imaging::ImageTransformer& transformer,
                        const std::string& source,
                        const pictor::core::ProcessOptions& options,
                        StageTimingCallback* timing_cb) {
  return transformer.process(source, options, timing_cb);
}

void run_process_batch(const pictor::imaging::ImageTransformer& transformer,
                       const std::vector<std::string>& sources,
                       const pictor::core::ProcessOptions& options,
                       ProcessResultCallback callback) {
  for (std::size_t i = 0; i < sources.size(); ++i) {
    auto result = transformer.process(sources[i], options);
    if (callback) callback(i, result);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_process_batch_parallel(const pictor::imaging::ImageTransformer& transformer,
                                const std::vector<std::string>& sources,
                                const pictor::core::ProcessOptions& options,
                                ProcessResultCallback callback,
                                std::size_t num_workers) {
  const std::size_t n = sources.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_process_batch(transformer, sources, options, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = transformer.process(sources[idx], options);
      callback(idx, result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace pictor::app
