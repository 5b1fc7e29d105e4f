#pragma once

#include <resampler/pixel_buffer.hh>
#include <resampler/types.hh>
#include <resampler/warning_macros.hh>
#include <algorithm>
#include <cstddef>
#include <thread>

RESAMPLER_DISABLE_ALL_WARNINGS_PUSH
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
RESAMPLER_DISABLE_ALL_WARNINGS_POP

namespace resampler {

    /**
     * Number of workers used when the caller does not pass a parallelism hint
     */
    inline std::size_t default_parallelism() noexcept {
        const unsigned int cores = std::thread::hardware_concurrency();
        return cores == 0 ? 1 : static_cast<std::size_t>(cores);
    }

    /**
     * Run kernel(out_row, y) once for every row y of target.
     *
     * Rows are split into disjoint ranges and each range is handed to one task
     * as a row_block, so a kernel can only write the rows it was given. The
     * call returns after every row has been written.
     *
     * @param target Buffer whose rows are produced
     * @param parallelism Maximum number of concurrent workers; 0 uses
     *        default_parallelism(), 1 runs on the calling thread
     * @param kernel Callable as kernel(byte_span out_row, index_t y); must not
     *        touch target other than through out_row
     */
    template<typename RowKernel>
    void for_each_row_parallel(pixel_buffer& target, std::size_t parallelism, RowKernel&& kernel) {
        const dimension_t height = target.height();
        if (height == 0) {
            return;
        }

        const std::size_t workers = parallelism == 0 ? default_parallelism() : parallelism;

        if (workers == 1 || height == 1) {
            const row_block block = target.rows(0, height);
            for (index_t y = 0; y < height; ++y) {
                kernel(block.row(y), y);
            }
            return;
        }

        tbb::task_arena arena(static_cast<int>(std::min<std::size_t>(workers, height)));
        arena.execute([&] {
            tbb::parallel_for(tbb::blocked_range<index_t>(0, height),
                              [&](const tbb::blocked_range<index_t>& range) {
                                  const row_block block = target.rows(range.begin(), range.end());
                                  for (index_t y = range.begin(); y != range.end(); ++y) {
                                      kernel(block.row(y), y);
                                  }
                              });
        });
    }

} // namespace resampler
