#define RANGEFUL_FN_ENABLE_RUN_TESTS 1
#define RANGEFUL_FALLIBLE_ENABLE_RUN_TESTS 1

#include <rangeful/fn.hpp>
#include <rangeful/fallible.hpp>

int main()
{
#if RANGEFUL_FN_ENABLE_RUN_TESTS
    rangeful::fn::impl::run_tests();
#endif

#if RANGEFUL_FALLIBLE_ENABLE_RUN_TESTS
    rangeful::fn::impl::run_fallible_tests();
#endif

    return 0;
}
