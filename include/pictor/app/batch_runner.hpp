#pragma once

#include <pictor/app/image_variants.hpp>
#include <pictor/core/pipeline.hpp>
#include <pictor/core/process_options.hpp>
#include <pictor/imaging/image_transformer.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace pictor::app {

/// Callback for each processed source: (index into sources, result).
/// Must be thread-safe if using run_process_batch_parallel.
using ProcessResultCallback =
    std::function<void(std::size_t index, const ImageResult& result)>;

/// Optional per-stage timing: (stage_index, stage_name, duration_ms).
using StageTimingCallback = pictor::core::StageTimingCallback;

/// Processes one source. No threading; direct call.
[[nodiscard]] ImageResult run_process(const pictor::imaging::ImageTransformer& transformer,
                                      const std::string& source,
                                      const pictor::core::ProcessOptions& options,
                                      StageTimingCallback* timing_cb = nullptr);

/// Processes sources sequentially; calls callback for each result, errors included.
void run_process_batch(const pictor::imaging::ImageTransformer& transformer,
                       const std::vector<std::string>& sources,
                       const pictor::core::ProcessOptions& options,
                       ProcessResultCallback callback);

/// Processes sources on a pool of worker threads.
/// callback may be invoked from any worker (must be thread-safe); results
/// arrive in completion order, use the index to match them to sources.
/// num_workers 0 = use hardware concurrency.
void run_process_batch_parallel(const pictor::imaging::ImageTransformer& transformer,
                                const std::vector<std::string>& sources,
                                const pictor::core::ProcessOptions& options,
                                ProcessResultCallback callback,
                                std::size_t num_workers = 0);

}  // namespace pictor::app
