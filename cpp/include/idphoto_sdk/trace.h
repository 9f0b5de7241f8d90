/**
 * @file trace.h
 * @brief 크롭 엔진 관측용 트레이스 훅
 *
 * 엔진은 전역 로거를 사용하지 않고 호출자가 주입한 훅으로만
 * 결정 과정과 폴백을 보고한다.
 */

#pragma once

#include <cstdarg>
#include <functional>
#include <string>

#include "idphoto_sdk/export.h"

namespace idphoto_sdk {

/**
 * @brief 트레이스 레벨
 */
enum class TraceLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * @brief 단일 트레이스 이벤트
 */
struct TraceEvent {
    TraceLevel level = TraceLevel::Info;
    const char* stage = "";     ///< 이벤트를 발생시킨 단계 이름 (정적 문자열)
    std::string message;
};

/**
 * @brief 트레이스 훅 타입
 */
using TraceHook = std::function<void(const TraceEvent&)>;

IDPHOTO_SDK_EXPORT const char* toString(TraceLevel level);

/**
 * @brief stderr 출력 훅 생성
 *
 * "[WARNING] head_top_refiner: ..." 형식으로 한 줄씩 출력한다.
 *
 * @param min_level 이 레벨 미만의 이벤트는 무시
 */
IDPHOTO_SDK_EXPORT TraceHook makeStderrTraceHook(TraceLevel min_level = TraceLevel::Info);

namespace detail {

/**
 * @brief 단계별 트레이스 헬퍼 (내부용)
 *
 * 훅이 비어 있으면 메시지 포맷팅도 생략한다.
 */
class Tracer {
public:
    Tracer(const TraceHook& hook, const char* stage) : hook_(hook), stage_(stage) {}

    bool enabled() const noexcept { return static_cast<bool>(hook_); }

    template <typename... Args>
    void debug(const char* fmt, Args... args) const { log(TraceLevel::Debug, fmt, args...); }

    template <typename... Args>
    void info(const char* fmt, Args... args) const { log(TraceLevel::Info, fmt, args...); }

    template <typename... Args>
    void warning(const char* fmt, Args... args) const { log(TraceLevel::Warning, fmt, args...); }

    template <typename... Args>
    void error(const char* fmt, Args... args) const { log(TraceLevel::Error, fmt, args...); }

private:
    /// printf 형식 인자를 받아 emit 으로 전달
    void log(TraceLevel level, const char* fmt, ...) const;
    void emit(TraceLevel level, const char* fmt, va_list args) const;

    const TraceHook& hook_;
    const char* stage_;
};

} // namespace detail

} // namespace idphoto_sdk
