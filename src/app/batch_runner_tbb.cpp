#include <pictor/app/batch_runner_tbb.hpp>

#ifdef PICTOR_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pictor::app {

void run_process_batch_tbb(
    const pictor::imaging::ImageTransformer& transformer,
    const std::vector<std::pair<std::string, std::string>>& work_items,
    const pictor::core::ProcessOptions& options,
    ProcessResultCallbackWithId callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&transformer, &work_items, &options, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& id = work_items[i].first;
          auto result = transformer.process(work_items[i].second, options);
          callback(id, result);
        }
      });
}

}  // namespace pictor::app

#endif  // PICTOR_HAS_TBB
