#include <esgate/utilities/os.h>

#include <esgate/utilities/testing.h>

using namespace esgate;

TEST_CASE("CPU count", "[utilities]")
{
    REQUIRE(detect_cpu_count() >= 1);
}
