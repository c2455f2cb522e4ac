#pragma once
#include <cstddef>
#include <cstdint>
#include <omp.h>

namespace TideSim
{

/**
 * Runs per-particle work over [0, count).
 * Every call to forEach returns only after all iterations finished, so consecutive
 * calls are separated by a full barrier. The serial mode runs the same loop on the
 * calling thread and is what the tests use as a reference.
 */
class ParallelExecutor
{
  private:
    bool parallel;
    int thread_count; // <= 0 lets OpenMP decide

  public:
    explicit ParallelExecutor(bool enable_parallel = true, int threads = -1)
        : parallel(enable_parallel), thread_count(threads)
    {
    }

    static ParallelExecutor serial()
    {
        return ParallelExecutor(false, 1);
    }

    bool isParallel() const
    {
        return parallel;
    }

    int getThreadCount() const
    {
        if (!parallel)
            return 1;
        return thread_count > 0 ? thread_count : omp_get_max_threads();
    }

    template <typename Fn> void forEach(size_t count, Fn &&fn) const
    {
        const std::int64_t n = static_cast<std::int64_t>(count);

        if (!parallel || n < 2)
        {
            for (std::int64_t i = 0; i < n; i++)
            {
                fn(static_cast<size_t>(i));
            }
            return;
        }

        const int threads = getThreadCount();

#pragma omp parallel for num_threads(threads) schedule(static)
        for (std::int64_t i = 0; i < n; i++)
        {
            fn(static_cast<size_t>(i));
        }
    }
};

} // namespace TideSim
