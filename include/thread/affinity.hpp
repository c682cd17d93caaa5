#ifndef UTIL_AFFINITY_HPP
#define UTIL_AFFINITY_HPP

#include <thread>

#ifdef _WIN32
#include <windows.h>
#elif defined(__linux__)
#include <pthread.h>
#include <sched.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/thread_policy.h>
#endif

namespace util
{

// Number of cores a worker index can be spread over; never zero.
inline unsigned core_count() noexcept
{
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

// Pins the calling thread to core `id` (taken modulo the core count).
// Returns false where pinning is unsupported or refused.
inline bool use_core(int id)
{
    if (id < 0) return false;
    id = static_cast<int>(static_cast<unsigned>(id) % core_count());

#ifdef _WIN32
    HANDLE    thread = GetCurrentThread();
    DWORD_PTR mask   = (1ULL << id);
    return SetThreadAffinityMask(thread, mask) != 0;
#elif defined(__linux__)
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#elif defined(__APPLE__)
    thread_affinity_policy_data_t policy = {id};
    return thread_policy_set(pthread_mach_thread_np(pthread_self()),
                             THREAD_AFFINITY_POLICY, (thread_policy_t)&policy, 1) == KERN_SUCCESS;
#else
    return false;
#endif
}

}  // namespace util

#endif  // UTIL_AFFINITY_HPP
