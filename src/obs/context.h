#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace cloudpulse::obs {

struct Context {
    std::string request_id;
    std::string run_id;
    std::string window_start;
    std::string window_end;
};

inline thread_local Context g_context{};
inline thread_local bool g_context_set = false;

inline auto GetContext() -> const Context& {
    return g_context;
}

inline auto HasContext() -> bool {
    return g_context_set;
}

inline auto SetContext(const Context& ctx) -> void {
    g_context = ctx;
    g_context_set = true;
}

inline auto ClearContext() -> void {
    g_context = Context{};
    g_context_set = false;
}

// Non-empty context fields are copied into `fields` unless already present.
inline auto MergeContext(nlohmann::json& fields) -> void {
    if (!g_context_set) return;
    auto put = [&fields](const char* key, const std::string& value) {
        if (!value.empty() && !fields.contains(key)) {
            fields[key] = value;
        }
    };
    put("request_id", g_context.request_id);
    put("run_id", g_context.run_id);
    put("window_start", g_context.window_start);
    put("window_end", g_context.window_end);
}

class ScopedContext {
public:
    explicit ScopedContext(const Context& ctx)
        : prev_(g_context), prev_set_(g_context_set) {
        SetContext(ctx);
    }

    ~ScopedContext() {
        if (prev_set_) {
            g_context = prev_;
            g_context_set = true;
        } else {
            ClearContext();
        }
    }

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

private:
    Context prev_{};
    bool prev_set_ = false;
};

} // namespace cloudpulse::obs
