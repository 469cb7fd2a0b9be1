#pragma once
/*
===============================================================================
TIMING — Wall-clock and thread CPU measurement around a solve
===============================================================================

OVERVIEW
--------
TimingHelper brackets one solve:

    TimingHelper timer;
    timer.start();
    ...                                 // build, optimize, read back
    timer.setSolverWall(engineRuntime); // optional, engine-reported
    timer.stop();
    Duration d = timer.duration();

Wall time uses std::chrono::steady_clock. Thread CPU time uses POSIX
CLOCK_THREAD_CPUTIME_ID when the platform provides it; isCpuTimingSupported()
reports whether it does.

===============================================================================
*/

#include <chrono>
#include <time.h>
#include <optional>

#include "errors.h"
#include "result.h"

namespace mpkit {

    class TimingHelper {
        using steady_clock = std::chrono::steady_clock;

        steady_clock::time_point wallStart_;
        steady_clock::time_point wallEnd_;
        std::optional<double> cpuStart_;
        std::optional<double> cpuEnd_;
        std::optional<double> solverWall_;
        std::optional<double> solverCpu_;
        bool started_ = false;
        bool stopped_ = false;

    public:
        /// @brief True iff the CPU time of the current thread can be measured
        static bool isCpuTimingSupported() noexcept
        {
            timespec resolution{};
            return clock_getres(CLOCK_THREAD_CPUTIME_ID, &resolution) == 0;
        }

        /// @brief CPU seconds consumed by the calling thread, if measurable
        static std::optional<double> threadCpuSeconds() noexcept
        {
            timespec now{};
            if (clock_gettime(CLOCK_THREAD_CPUTIME_ID, &now) != 0)
                return std::nullopt;
            return static_cast<double>(now.tv_sec) + static_cast<double>(now.tv_nsec) * 1e-9;
        }

        void start() noexcept
        {
            cpuStart_ = threadCpuSeconds();
            wallStart_ = steady_clock::now();
            solverWall_.reset();
            solverCpu_.reset();
            started_ = true;
            stopped_ = false;
        }

        /// @throws StatePrecondition if start() was not called
        void stop()
        {
            if (!started_)
                throw StatePrecondition("timing: stop() called before start()");
            wallEnd_ = steady_clock::now();
            cpuEnd_ = threadCpuSeconds();
            stopped_ = true;
        }

        /// @brief Wall seconds the engine reports for its own run
        void setSolverWall(double seconds) { solverWall_ = seconds; }

        /// @brief CPU seconds the engine reports for its own run
        void setSolverCpu(double seconds) { solverCpu_ = seconds; }

        double elapsedWall() const noexcept
        {
            const auto end = stopped_ ? wallEnd_ : steady_clock::now();
            return std::chrono::duration<double>(end - wallStart_).count();
        }

        /**
         * @brief Measured times
         *
         * @throws StatePrecondition unless stop() was called
         * @throws InvalidArgument if an engine-reported time is negative
         */
        Duration duration() const
        {
            if (!stopped_)
                throw StatePrecondition("timing: duration asked before stop()");
            std::optional<double> cpu;
            if (cpuStart_ && cpuEnd_)
                cpu = *cpuEnd_ - *cpuStart_;
            return Duration(elapsedWall(), cpu, solverWall_, solverCpu_);
        }
    };

} // namespace mpkit
