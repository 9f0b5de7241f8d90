/**
 * @file trace.cpp
 * @brief 트레이스 훅 및 stderr 출력 구현
 */

#include "idphoto_sdk/trace.h"

#include <cstdio>

namespace idphoto_sdk {

namespace {
    /// 단일 트레이스 메시지 최대 길이
    constexpr size_t MAX_MESSAGE_LENGTH = 512;
}

const char* toString(TraceLevel level) {
    switch (level) {
        case TraceLevel::Debug: return "DEBUG";
        case TraceLevel::Info: return "INFO";
        case TraceLevel::Warning: return "WARNING";
        case TraceLevel::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

TraceHook makeStderrTraceHook(TraceLevel min_level) {
    return [min_level](const TraceEvent& event) {
        if (static_cast<int>(event.level) < static_cast<int>(min_level)) {
            return;
        }
        std::fprintf(stderr, "[%s] %s: %s\n",
                     toString(event.level), event.stage, event.message.c_str());
    };
}

namespace detail {

void Tracer::emit(TraceLevel level, const char* fmt, va_list args) const {
    char buf[MAX_MESSAGE_LENGTH];
    std::vsnprintf(buf, sizeof(buf), fmt, args);

    TraceEvent event;
    event.level = level;
    event.stage = stage_;
    event.message = buf;
    hook_(event);
}

void Tracer::log(TraceLevel level, const char* fmt, ...) const {
    // 훅이 없으면 포맷팅 생략
    if (!hook_) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    emit(level, fmt, args);
    va_end(args);
}

} // namespace detail

} // namespace idphoto_sdk
