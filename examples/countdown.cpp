#include <turnstile/assert.hpp>
#include <turnstile/async/polling_wait_loop.hpp>
#include <turnstile/async/predicate_gate.hpp>
#include <turnstile/status.hpp>

#include <iostream>

enum struct CountdownError {
    kOk = 0,
    kScrubbed = 1,
};

int main()
{
    tstile::Status::register_codes<CountdownError>({
        {CountdownError::kOk, "Ok"},
        {CountdownError::kScrubbed, "Launch scrubbed"},
    });

    tstile::PollingWaitLoop wait_loop{tstile::PollingPolicy::fixed_interval(100 * 1000)};

    int remaining = 5;
    auto launch = tstile::make_predicate_gate(
        "countdown reaches zero",
        [&remaining] {
            return remaining == 0;
        },
        wait_loop);

    TSTILE_CHECK_OK(launch
                        ->during([&remaining] {
                            std::cout << "T-" << remaining << std::endl;
                            remaining -= 1;
                        })
                        ->then([] {
                            std::cout << "Liftoff!" << std::endl;
                        })
                        ->on_timeout([] {
                            std::cout << "Holding..." << std::endl;
                        })
                        ->set_timeout_translator([](const tstile::Status&) -> tstile::Optional<tstile::Status> {
                            return tstile::Status{CountdownError::kScrubbed};
                        }));

    tstile::Status status = launch->wait(tstile::WaitLoop::Duration{boost::posix_time::seconds(5)});

    std::cout << *launch << ": " << status << std::endl;

    return status.ok() ? 0 : 1;
}
