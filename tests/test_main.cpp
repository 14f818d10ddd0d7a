// Only translation unit of suffugium_tests that defines DOCTEST_CONFIG_IMPLEMENT.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>

namespace
{
    bool envTruthy(const char *v)
    {
        return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
    }

    bool runningInCi()
    {
        return envTruthy(std::getenv("CI")) || envTruthy(std::getenv("GITHUB_ACTIONS"));
    }
} // namespace

int main(int argc, char **argv)
{
    spdlog::set_level(spdlog::level::warn);

    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (runningInCi())
    {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    return context.run();
}
