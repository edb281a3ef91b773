#pragma once

#include <pictor/app/image_variants.hpp>
#include <pictor/core/process_options.hpp>
#include <pictor/imaging/image_transformer.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#ifdef PICTOR_HAS_TBB

namespace pictor::app {

/// Callback for each processed work item; receives the item id and its result.
/// May be invoked from TBB worker threads; must be thread-safe.
using ProcessResultCallbackWithId =
    std::function<void(const std::string& id, const ImageResult& result)>;

/// Processes a batch of (id, source) work items in parallel using TBB.
///
/// Each work item is (id, base64 source), e.g. (record field name, upload).
/// The same transformer serves every task: process() keeps no state between
/// calls, so this is safe as long as its codec and color source are
/// thread-safe (the defaults are).
///
/// \param transformer Shared transformer. Caller keeps ownership.
/// \param work_items Flat list of (id, source) pairs. Read only.
/// \param options Options applied to every item.
/// \param callback Invoked for each item with (id, result), errors included. Must be thread-safe.
void run_process_batch_tbb(
    const pictor::imaging::ImageTransformer& transformer,
    const std::vector<std::pair<std::string, std::string>>& work_items,
    const pictor::core::ProcessOptions& options,
    ProcessResultCallbackWithId callback);

}  // namespace pictor::app

#endif  // PICTOR_HAS_TBB
