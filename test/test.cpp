#define PSEUDOENUM_FN_ENABLE_RUN_TESTS 1

#include <enumerable.hpp>

int main()
{
#if PSEUDOENUM_FN_ENABLE_RUN_TESTS
    pseudoenum::fn::impl::run_tests();
#endif

    return 0;
}
