#include <iostream>
#include <string>

#include <turnstile.hpp>

int
main()
{
    // Smoke test for <turnstile/assert.hpp>
    //
    TSTILE_CHECK_EQ(1 + 1, 2);

    // Smoke test for <turnstile/utility.hpp>
    //
    if (TSTILE_HINT_TRUE(tstile::to_string(2 * 2) == "4")) {
        std::cout << "Math is working." << std::endl;
    }

    // Smoke test for <turnstile/int_types.hpp>
    //
    using namespace tstile::int_types;

    u8 x_8 = 0xff;
    u16 x_16 = 0xffff;
    u32 x_32 = 0xffffffff;
    (void)x_8;
    (void)x_16;
    (void)x_32;

    // Smoke test for <turnstile/status.hpp>
    //
    TSTILE_CHECK_OK(tstile::OkStatus());
    TSTILE_CHECK(!tstile::Status{tstile::StatusCode::kDeadlineExceeded}.ok());

    // Smoke test for <turnstile/type_traits.hpp>
    //
    static_assert(tstile::IsCallable<void (*)(int), int>{}, "function pointers are callable!");

    // Smoke test for <turnstile/async/predicate_gate.hpp>
    //
    tstile::FakeClock clock;
    tstile::FakeClock::WaitLoopType wait_loop = clock.make_wait_loop();

    int polls = 0;
    auto gate = tstile::make_predicate_gate(
        "three polls",
        [&polls] {
            polls += 1;
            return polls == 3;
        },
        wait_loop);

    TSTILE_CHECK_OK(gate->then([] {
                            std::cout << "Gate is working." << std::endl;
                        })
                        ->set_default_timeout(boost::posix_time::seconds(1)));
    TSTILE_CHECK_OK(gate->wait());
    TSTILE_CHECK(gate->is_finished());

    return 0;
}
