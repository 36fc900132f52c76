#include <shaderpad/uniforms.hpp>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdio>

int main() {
    using namespace std::chrono_literals;
    using shaderpad::Clock;

    static_assert(shaderpad::kUniformBlockBytes<shaderpad::TimeUniform> == 16);
    static_assert(shaderpad::kUniformBlockBytes<shaderpad::MouseUniform> == 16);

    // Elapsed milliseconds, truncated
    {
        shaderpad::TimeUniform t;
        assert(t.milliseconds == 0);

        Clock::time_point start{};
        t.update(start, start + 1500ms);
        assert(t.milliseconds == 1500);

        t.update(start, start + 2999us);
        assert(t.milliseconds == 2);

        t.update(start, start);
        assert(t.milliseconds == 0);
        std::printf("  time update: ok\n");
    }

    // A clock behind start reads as zero, not a wrapped huge value
    {
        shaderpad::TimeUniform t;
        Clock::time_point start = Clock::time_point{} + 10s;
        t.update(start, start - 5ms);
        assert(t.milliseconds == 0);
        std::printf("  time before start: ok\n");
    }

    // Past the uint32 range the value holds at the maximum
    {
        shaderpad::TimeUniform t;
        Clock::time_point start{};
        constexpr std::uint32_t kMax = 0xFFFFFFFFu;

        t.update(start, start + std::chrono::milliseconds(kMax - 1));
        assert(t.milliseconds == kMax - 1);

        t.update(start, start + std::chrono::milliseconds(std::int64_t{kMax} + 1));
        assert(t.milliseconds == kMax);

        t.update(start, start + std::chrono::hours(24 * 50));
        assert(t.milliseconds == kMax);
        std::printf("  time saturates: ok\n");
    }

    // Monotonic across consecutive updates from the real clock
    {
        shaderpad::TimeUniform t;
        auto start = Clock::now();
        std::uint32_t last = 0;
        for (int i = 0; i < 1000; ++i) {
            t.update(start, Clock::now());
            assert(t.milliseconds >= last);
            last = t.milliseconds;
        }
        std::printf("  time monotonic: ok\n");
    }

    // y flips, x passes through
    {
        shaderpad::MouseUniform m;
        assert(m.cursor.x == 0.0f && m.cursor.y == 0.0f);

        m.updatePosition(0.5f, 0.25f);
        assert(m.cursor.x == 0.5f);
        assert(m.cursor.y == 0.75f);

        m.updatePosition(0.0f, 0.0f);
        assert(m.cursor.y == 1.0f);

        m.updatePosition(1.0f, 1.0f);
        assert(m.cursor.x == 1.0f && m.cursor.y == 0.0f);
        std::printf("  mouse flip: ok\n");
    }

    return 0;
}
