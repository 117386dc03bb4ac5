#include "zlog/process_info.hpp"

#include <unistd.h>

#include <climits>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

namespace zlog {

namespace {

std::string query_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    buf[sizeof(buf) - 1] = '\0';
    return std::string(buf);
}

} // namespace

const std::string& hostname() {
    static const std::string name = query_hostname();
    return name;
}

// fork 之后子进程 pid 会变，不能缓存
uint32_t process_id() {
    return static_cast<uint32_t>(::getpid());
}

} // namespace zlog
