/**
 * @file batch_delay_example.cpp
 * @brief Example: how the damage batch delay reacts to a slowing client
 */

#include <iomanip>
#include <iostream>
#include "../src/core/include/rdx_batch.hpp"
#include "../src/core/include/rdx_logger.hpp"

using namespace rdx;

int main() {
    Logger::instance().setLevel(LogLevel::WARN);

    std::cout << "=== Damage batch delay example ===\n\n";

    BatchBounds bounds;
    DamageBatchConfig batch(bounds, 1);
    DamageStatistics stats(bounds.history_size);
    BatchInputs inputs;
    inputs.window_pixels = 1920.0 * 1080.0;
    inputs.region_pixels = 256.0 * 256.0;

    batch.delay_per_megapixel = 20.0;
    batch.delay = batch.initial_delay_for(inputs.window_pixels);
    std::cout << "1. Initial delay for a 1920x1080 window: " << batch.delay << " ms\n\n";

    std::cout << "2. Client latency climbing from 5 ms to 200 ms:\n";
    double now = monotonic_seconds();
    for (int step = 0; step < 20; ++step) {
        now += 0.1;
        double latency = 0.005 + step * 0.01;
        stats.record_client_latency(now, latency);
        stats.record_queue_size(now, step / 4);
        stats.record_send(now, 64.0 * 1024.0, 0.002 + latency / 10.0);

        batch.recompute(now, batch.delay, stats, inputs);
        std::cout << "   latency " << std::setw(5) << static_cast<int>(latency * 1000) << " ms"
                  << "  ->  delay " << std::setw(4) << batch.delay << " ms\n";
    }

    std::cout << "\n3. Factors from the last update:\n";
    for (const auto& f : batch.factors) {
        std::cout << "   " << std::left << std::setw(20) << f.metric << std::right
                  << " factor " << std::fixed << std::setprecision(3) << f.factor
                  << "  weight " << f.weight << "  " << f.info << "\n";
    }

    std::cout << "\n4. Window loses focus and goes idle:\n";
    inputs.has_focus = false;
    batch.lock();
    batch.recompute(now + 0.1, batch.delay, stats, inputs);
    std::cout << "   locked delay: " << batch.delay << " ms\n";
    batch.unlock();
    std::cout << "   restored delay: " << batch.delay << " ms\n";

    batch.cleanup();
    return 0;
}
