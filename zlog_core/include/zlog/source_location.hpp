#pragma once
#include <cstdint>

#if __cplusplus >= 202002L && __has_include(<source_location>)
    #include <source_location>
    #define ZLOG_HAS_SOURCE_LOCATION 1
#else
    #define ZLOG_HAS_SOURCE_LOCATION 0
#endif

namespace zlog {

struct SourceLocation {
    const char* file_path;
    const char* function_name;
    uint32_t    line;
};

} // namespace zlog

#if ZLOG_HAS_SOURCE_LOCATION
    #define ZLOG_CURRENT_LOCATION() \
        ::zlog::SourceLocation { \
            std::source_location::current().file_name(), \
            std::source_location::current().function_name(), \
            static_cast<uint32_t>(std::source_location::current().line()) \
        }
#else
    #define ZLOG_CURRENT_LOCATION() \
        ::zlog::SourceLocation { \
            __FILE__, \
            __func__, \
            static_cast<uint32_t>(__LINE__) \
        }
#endif
