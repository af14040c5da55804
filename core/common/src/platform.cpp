#include <xfer/common/platform.hpp>

#include <cstdlib>

#include <pthread.h>
#include <unistd.h>
#if defined(XFER_OS_LINUX)
#include <sys/syscall.h>
#endif

namespace xfer::common::platform {

namespace {
constexpr size_t OS_THREAD_NAME_MAX = 15;
}

uint64_t get_thread_id() noexcept {
#if defined(XFER_OS_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#elif defined(XFER_OS_MACOS)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return reinterpret_cast<uint64_t>(pthread_self());
#endif
}

bool set_thread_name(std::string_view name) noexcept {
    char buffer[OS_THREAD_NAME_MAX + 1] = {};
    name.copy(buffer, OS_THREAD_NAME_MAX);
#if defined(XFER_OS_MACOS)
    return pthread_setname_np(buffer) == 0;
#else
    return pthread_setname_np(pthread_self(), buffer) == 0;
#endif
}

std::string get_env(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    return value ? std::string(value) : std::string{};
}

bool set_env(std::string_view name, std::string_view value) {
    return setenv(std::string(name).c_str(), std::string(value).c_str(), 1) == 0;
}

bool unset_env(std::string_view name) {
    return unsetenv(std::string(name).c_str()) == 0;
}

}  // namespace xfer::common::platform
